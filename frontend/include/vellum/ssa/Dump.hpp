// frontend/include/vellum/ssa/Dump.hpp
#pragma once
#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/TypePool.hpp>

#include <ostream>


namespace vellum::ssa {

    void dump(const Module& m, const ty::TypePool& types, std::ostream& os);

} // namespace vellum::ssa
