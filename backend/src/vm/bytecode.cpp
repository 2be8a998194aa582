// backend/src/vm/bytecode.cpp
#include <vellum/backend/vm/Bytecode.hpp>
#include <vellum/backend/host/HostInterface.hpp>

#include <llvm/Support/EndianStream.h>
#include <llvm/Support/LEB128.h>
#include <llvm/Support/raw_ostream.h>

#include <cstring>


namespace vellum::backend::vm {

    namespace {

        enum class Section : uint8_t {
            kImports = 1,
            kFunctions = 2,
            kExports = 3,
            kData = 4,
        };

        void write_str_(llvm::raw_ostream& os, std::string_view s) {
            llvm::encodeULEB128(s.size(), os);
            os << llvm::StringRef(s.data(), s.size());
        }

        void write_section_(llvm::raw_ostream& os, Section id, const std::string& payload) {
            os << static_cast<char>(id);
            llvm::encodeULEB128(payload.size(), os);
            os << payload;
        }

        /// @brief 경계 검사를 하는 순차 reader.
        class Reader final {
        public:
            explicit Reader(std::string_view s) : s_(s) {}

            bool eof() const { return pos_ >= s_.size(); }
            const std::string& error() const { return err_; }

            bool u8(uint8_t& out) {
                if (pos_ >= s_.size()) return fail_("unexpected end of input");
                out = static_cast<uint8_t>(s_[pos_++]);
                return true;
            }

            bool uleb(uint64_t& out) {
                if (pos_ >= s_.size()) return fail_("unexpected end of input");
                unsigned n = 0;
                const char* why = nullptr;
                const auto* p = reinterpret_cast<const uint8_t*>(s_.data() + pos_);
                const auto* end = reinterpret_cast<const uint8_t*>(s_.data() + s_.size());
                out = llvm::decodeULEB128(p, &n, end, &why);
                if (why != nullptr) return fail_(why);
                pos_ += n;
                return true;
            }

            bool u32(uint32_t& out) {
                uint64_t v = 0;
                if (!uleb(v)) return false;
                if (v > 0xFFFF'FFFFu) return fail_("value out of range");
                out = static_cast<uint32_t>(v);
                return true;
            }

            bool str(std::string& out) {
                uint64_t n = 0;
                if (!uleb(n)) return false;
                if (n > s_.size() - pos_) return fail_("string runs past end of input");
                out.assign(s_.data() + pos_, static_cast<size_t>(n));
                pos_ += static_cast<size_t>(n);
                return true;
            }

            bool raw(size_t n, std::string_view& out) {
                if (n > s_.size() - pos_) return fail_("unexpected end of input");
                out = s_.substr(pos_, n);
                pos_ += n;
                return true;
            }

        private:
            bool fail_(std::string why) {
                if (err_.empty()) err_ = std::move(why);
                return false;
            }

            std::string_view s_;
            size_t pos_ = 0;
            std::string err_;
        };

        bool read_imports_(Reader& r, Module& m) {
            uint32_t n = 0;
            if (!r.u32(n)) return false;
            for (uint32_t i = 0; i < n; ++i) {
                Import im{};
                uint8_t has_result = 0;
                if (!r.str(im.module) || !r.u32(im.version) || !r.str(im.name) ||
                    !r.u32(im.num_args) || !r.u8(has_result)) {
                    return false;
                }
                im.has_result = (has_result != 0);
                m.imports.push_back(std::move(im));
            }
            return true;
        }

        bool read_functions_(Reader& r, Module& m, std::string& err) {
            uint32_t n = 0;
            if (!r.u32(n)) return false;
            for (uint32_t i = 0; i < n; ++i) {
                Function f{};
                uint8_t has_result = 0;
                uint32_t ncode = 0;
                if (!r.str(f.name) || !r.u32(f.num_params) || !r.u32(f.num_locals) ||
                    !r.u8(has_result) || !r.u32(ncode)) {
                    return false;
                }
                f.has_result = (has_result != 0);
                f.code.reserve(ncode);
                for (uint32_t k = 0; k < ncode; ++k) {
                    uint8_t op = 0;
                    if (!r.u8(op)) return false;
                    if (op > static_cast<uint8_t>(Op::kTrap)) {
                        err = "unknown opcode " + std::to_string(op) + " in function '" + f.name + "'";
                        return false;
                    }
                    Instr ins{};
                    ins.op = static_cast<Op>(op);
                    if (has_imm(ins.op) && !r.uleb(ins.imm)) return false;
                    f.code.push_back(ins);
                }
                m.functions.push_back(std::move(f));
            }
            return true;
        }

        bool read_exports_(Reader& r, Module& m) {
            uint32_t n = 0;
            if (!r.u32(n)) return false;
            for (uint32_t i = 0; i < n; ++i) {
                Export e{};
                if (!r.str(e.name) || !r.u32(e.func)) return false;
                m.exports.push_back(std::move(e));
            }
            return true;
        }

        bool read_data_(Reader& r, Module& m) {
            uint32_t n = 0;
            if (!r.u32(n)) return false;
            for (uint32_t i = 0; i < n; ++i) {
                DataSegment d{};
                if (!r.uleb(d.offset) || !r.str(d.bytes)) return false;
                m.data.push_back(std::move(d));
            }
            return true;
        }

    } // namespace

    const char* op_name(Op op) {
        switch (op) {
            case Op::kNop: return "nop";
            case Op::kConst: return "const";
            case Op::kLocalGet: return "local.get";
            case Op::kLocalSet: return "local.set";
            case Op::kLocalTee: return "local.tee";
            case Op::kDrop: return "drop";
            case Op::kAdd: return "add";
            case Op::kSub: return "sub";
            case Op::kMul: return "mul";
            case Op::kDivS: return "div_s";
            case Op::kDivU: return "div_u";
            case Op::kRemS: return "rem_s";
            case Op::kRemU: return "rem_u";
            case Op::kShl: return "shl";
            case Op::kShrS: return "shr_s";
            case Op::kShrU: return "shr_u";
            case Op::kAnd: return "and";
            case Op::kOr: return "or";
            case Op::kXor: return "xor";
            case Op::kEq: return "eq";
            case Op::kNe: return "ne";
            case Op::kLtS: return "lt_s";
            case Op::kLtU: return "lt_u";
            case Op::kLeS: return "le_s";
            case Op::kLeU: return "le_u";
            case Op::kGtS: return "gt_s";
            case Op::kGtU: return "gt_u";
            case Op::kGeS: return "ge_s";
            case Op::kGeU: return "ge_u";
            case Op::kEqz: return "eqz";
            case Op::kSext: return "sext";
            case Op::kZext: return "zext";
            case Op::kLoad: return "load";
            case Op::kStore: return "store";
            case Op::kMemCopy: return "memcpy";
            case Op::kJmp: return "jmp";
            case Op::kJmpIf: return "jmp_if";
            case Op::kJmpIfNot: return "jmp_ifnot";
            case Op::kCall: return "call";
            case Op::kCallHost: return "call_host";
            case Op::kRet: return "ret";
            case Op::kTrap: return "trap";
        }
        return "op(?)";
    }

    bool has_imm(Op op) {
        switch (op) {
            case Op::kConst:
            case Op::kLocalGet:
            case Op::kLocalSet:
            case Op::kLocalTee:
            case Op::kSext:
            case Op::kZext:
            case Op::kJmp:
            case Op::kJmpIf:
            case Op::kJmpIfNot:
            case Op::kCall:
            case Op::kCallHost:
            case Op::kTrap:
                return true;
            default:
                return false;
        }
    }

    void disassemble(const Module& m, std::ostream& os) {
        os << "VLBC v" << kFormatVersion
           << " pages=" << m.memory_pages
           << " heap_base=" << m.heap_base
           << "\n";

        for (size_t i = 0; i < m.imports.size(); ++i) {
            const auto& im = m.imports[i];
            const auto ref = host::lookup(im.module, im.version, im.name);
            os << "  import #" << i << " ";
            if (ref.module != nullptr) os << host::qualified_name(*ref.module);
            else os << im.module << "@" << im.version << " (unknown)";
            os << "." << im.name
               << " args=" << im.num_args << (im.has_result ? " -> status" : "") << "\n";
        }
        for (const auto& d : m.data) {
            os << "  data @" << d.offset << " len=" << d.bytes.size() << "\n";
        }
        for (const auto& e : m.exports) {
            os << "  export " << e.name << " = fn#" << e.func << "\n";
        }

        for (size_t fi = 0; fi < m.functions.size(); ++fi) {
            const auto& f = m.functions[fi];
            os << "\n  fn #" << fi << " " << f.name
               << " params=" << f.num_params
               << " locals=" << f.num_locals
               << (f.has_result ? " -> word" : "")
               << "\n";
            for (size_t pc = 0; pc < f.code.size(); ++pc) {
                const auto& ins = f.code[pc];
                os << "    " << pc << ": " << op_name(ins.op);
                if (has_imm(ins.op)) {
                    if (ins.op == Op::kConst) os << " " << static_cast<int64_t>(ins.imm);
                    else os << " " << ins.imm;
                }
                if (ins.op == Op::kCallHost && ins.imm < m.imports.size()) {
                    os << " ; " << m.imports[ins.imm].module << "." << m.imports[ins.imm].name;
                } else if (ins.op == Op::kCall && ins.imm < m.functions.size()) {
                    os << " ; " << m.functions[ins.imm].name;
                }
                os << "\n";
            }
        }
    }

    std::string serialize(const Module& m) {
        std::string out;
        llvm::raw_string_ostream os(out);

        os.write(kMagic, sizeof(kMagic));
        llvm::support::endian::write<uint16_t>(os, kFormatVersion, llvm::support::little);
        llvm::encodeULEB128(m.memory_pages, os);
        llvm::encodeULEB128(m.heap_base, os);

        {
            std::string p;
            llvm::raw_string_ostream ps(p);
            llvm::encodeULEB128(m.imports.size(), ps);
            for (const auto& im : m.imports) {
                write_str_(ps, im.module);
                llvm::encodeULEB128(im.version, ps);
                write_str_(ps, im.name);
                llvm::encodeULEB128(im.num_args, ps);
                ps << static_cast<char>(im.has_result ? 1 : 0);
            }
            write_section_(os, Section::kImports, ps.str());
        }
        {
            std::string p;
            llvm::raw_string_ostream ps(p);
            llvm::encodeULEB128(m.functions.size(), ps);
            for (const auto& f : m.functions) {
                write_str_(ps, f.name);
                llvm::encodeULEB128(f.num_params, ps);
                llvm::encodeULEB128(f.num_locals, ps);
                ps << static_cast<char>(f.has_result ? 1 : 0);
                llvm::encodeULEB128(f.code.size(), ps);
                for (const auto& ins : f.code) {
                    ps << static_cast<char>(ins.op);
                    if (has_imm(ins.op)) llvm::encodeULEB128(ins.imm, ps);
                }
            }
            write_section_(os, Section::kFunctions, ps.str());
        }
        {
            std::string p;
            llvm::raw_string_ostream ps(p);
            llvm::encodeULEB128(m.exports.size(), ps);
            for (const auto& e : m.exports) {
                write_str_(ps, e.name);
                llvm::encodeULEB128(e.func, ps);
            }
            write_section_(os, Section::kExports, ps.str());
        }
        {
            std::string p;
            llvm::raw_string_ostream ps(p);
            llvm::encodeULEB128(m.data.size(), ps);
            for (const auto& d : m.data) {
                llvm::encodeULEB128(d.offset, ps);
                write_str_(ps, d.bytes);
            }
            write_section_(os, Section::kData, ps.str());
        }

        os.flush();
        return out;
    }

    bool deserialize(std::string_view bytes, Module& out, std::string& err) {
        out = Module{};
        Reader r(bytes);

        std::string_view magic;
        if (!r.raw(sizeof(kMagic), magic) || std::memcmp(magic.data(), kMagic, sizeof(kMagic)) != 0) {
            err = "not a VLBC container";
            return false;
        }
        std::string_view ver;
        if (!r.raw(2, ver)) {
            err = r.error();
            return false;
        }
        const uint16_t version = static_cast<uint16_t>(
            static_cast<uint8_t>(ver[0]) | (static_cast<uint8_t>(ver[1]) << 8));
        if (version != kFormatVersion) {
            err = "unsupported VLBC version " + std::to_string(version);
            return false;
        }
        if (!r.u32(out.memory_pages) || !r.uleb(out.heap_base)) {
            err = r.error();
            return false;
        }

        while (!r.eof()) {
            uint8_t id = 0;
            uint64_t size = 0;
            std::string_view payload;
            if (!r.u8(id) || !r.uleb(size) || !r.raw(static_cast<size_t>(size), payload)) {
                err = r.error();
                return false;
            }

            Reader sr(payload);
            bool ok = false;
            switch (static_cast<Section>(id)) {
                case Section::kImports: ok = read_imports_(sr, out); break;
                case Section::kFunctions: ok = read_functions_(sr, out, err); break;
                case Section::kExports: ok = read_exports_(sr, out); break;
                case Section::kData: ok = read_data_(sr, out); break;
                default:
                    err = "unknown section id " + std::to_string(id);
                    return false;
            }
            if (!ok) {
                if (err.empty()) err = sr.error();
                return false;
            }
        }
        return true;
    }

} // namespace vellum::backend::vm
