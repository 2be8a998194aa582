// frontend/src/diag/render.cpp
#include <vellum/diag/Render.hpp>

#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

#include <sstream>


namespace vellum::diag {

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    std::string_view code_name(Code c) {
        switch (c) {
            case Code::kHirMalformed: return "HirMalformed";
            case Code::kHirUnknownName: return "HirUnknownName";
            case Code::kHirUnknownType: return "HirUnknownType";
            case Code::kHirTypeMismatch: return "HirTypeMismatch";
            case Code::kHirDuplicateName: return "HirDuplicateName";
            case Code::kHirArgCountMismatch: return "HirArgCountMismatch";
            case Code::kHirNotAPlace: return "HirNotAPlace";

            case Code::kOwnUseAfterMove: return "OwnUseAfterMove";
            case Code::kOwnMoveWhileBorrowed: return "OwnMoveWhileBorrowed";
            case Code::kOwnBorrowConflict: return "OwnBorrowConflict";
            case Code::kOwnMutBorrowOfImmutable: return "OwnMutBorrowOfImmutable";
            case Code::kOwnAssignToImmutable: return "OwnAssignToImmutable";
            case Code::kOwnMoveOutOfBorrowed: return "OwnMoveOutOfBorrowed";

            case Code::kAttrMalformed: return "AttrMalformed";
            case Code::kDomainWildcardFallback: return "DomainWildcardFallback";
            case Code::kDomainDynamicKeyRejected: return "DomainDynamicKeyRejected";
            case Code::kDomainUnderDeclared: return "DomainUnderDeclared";
            case Code::kDomainOverDeclared: return "DomainOverDeclared";

            case Code::kBackendTooManyLocals: return "BackendTooManyLocals";
            case Code::kBackendValueTooLarge: return "BackendValueTooLarge";
            case Code::kBackendUnsupported: return "BackendUnsupported";

            case Code::kFnExcluded: return "FnExcluded";
            case Code::kSsaVerifyFailed: return "SsaVerifyFailed";
            case Code::kTooManyErrors: return "TooManyErrors";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            // args: {0}=detail
            case Code::kHirMalformed: return "malformed HIR document: {0}";
            case Code::kHirUnknownName: return "unknown name '{0}'";
            case Code::kHirUnknownType: return "unknown type '{0}'";
            // args: {0}=expected, {1}=found
            case Code::kHirTypeMismatch: return "type mismatch: expected '{0}', found '{1}'";
            case Code::kHirDuplicateName: return "duplicate definition of '{0}'";
            // args: {0}=callee, {1}=expected, {2}=found
            case Code::kHirArgCountMismatch: return "call to '{0}' expects {1} argument(s), found {2}";
            case Code::kHirNotAPlace: return "argument for 'mut' parameter '{0}' must be a local binding";

            case Code::kOwnUseAfterMove: return "use of moved binding '{0}'";
            // args: {0}=binding, {1}=held borrow
            case Code::kOwnMoveWhileBorrowed: return "cannot move '{0}' while it is {1}";
            // args: {0}=binding, {1}=requested access, {2}=held borrow
            case Code::kOwnBorrowConflict: return "cannot {1} '{0}' while it is {2}";
            case Code::kOwnMutBorrowOfImmutable: return "cannot borrow immutable binding '{0}' exclusively";
            case Code::kOwnAssignToImmutable: return "cannot assign twice to immutable binding '{0}'";
            case Code::kOwnMoveOutOfBorrowed: return "cannot move out of '{0}', which is a borrowed parameter";

            // args: {0}=annotation text, {1}=reason
            case Code::kAttrMalformed: return "malformed annotation '{0}': {1}";
            // args: {0}=function, {1}=namespace, {2}=wildcard key
            case Code::kDomainWildcardFallback:
                return "function '{0}': state key in namespace '{1}' is not statically resolvable; "
                       "access coarsened to '{2}' (consider an explicit #[reads]/#[writes] annotation)";
            case Code::kDomainDynamicKeyRejected:
                return "function '{0}': state key in namespace '{1}' is not statically resolvable "
                       "and wildcard coarsening is disabled";
            // args: {0}=function, {1}=reads|writes, {2}=canonical key
            case Code::kDomainUnderDeclared:
                return "function '{0}' {1} '{2}' which is not covered by its declared #[{1}] set";
            case Code::kDomainOverDeclared:
                return "function '{0}' declares #[{1}] '{2}' but never touches it";

            // args: {0}=function, {1}=needed, {2}=limit
            case Code::kBackendTooManyLocals: return "internal limit: function '{0}' needs {1} locals, target allows {2}";
            // args: {0}=function, {1}=what, {2}=size, {3}=limit
            case Code::kBackendValueTooLarge: return "internal limit: function '{0}': {1} of size {2} exceeds target limit {3}";
            case Code::kBackendUnsupported: return "internal: function '{0}': cannot lower {1}";

            // args: {0}=function, {1}=reason
            case Code::kFnExcluded: return "function '{0}' excluded from output: {1}";
            case Code::kSsaVerifyFailed: return "internal: SSA verification failed in '{0}': {1}";
            case Code::kTooManyErrors: return "too many errors emitted; stopping";
        }
        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kHirMalformed: return "HIR 문서 형식이 올바르지 않습니다: {0}";
            case Code::kHirUnknownName: return "알 수 없는 이름 '{0}'";
            case Code::kHirUnknownType: return "알 수 없는 타입 '{0}'";
            case Code::kHirTypeMismatch: return "타입 불일치: '{0}'이(가) 필요하지만 '{1}'입니다";
            case Code::kHirDuplicateName: return "'{0}'이(가) 중복 정의되었습니다";
            case Code::kHirArgCountMismatch: return "'{0}' 호출은 인자 {1}개가 필요하지만 {2}개가 주어졌습니다";
            case Code::kHirNotAPlace: return "'mut' 매개변수 '{0}'의 인자는 지역 바인딩이어야 합니다";

            case Code::kOwnUseAfterMove: return "이미 이동된 바인딩 '{0}'을(를) 사용했습니다";
            case Code::kOwnMoveWhileBorrowed: return "'{0}'이(가) {1} 상태이므로 이동할 수 없습니다";
            case Code::kOwnBorrowConflict: return "'{0}'이(가) {2} 상태이므로 {1}할 수 없습니다";
            case Code::kOwnMutBorrowOfImmutable: return "불변 바인딩 '{0}'을(를) 배타적으로 빌릴 수 없습니다";
            case Code::kOwnAssignToImmutable: return "불변 바인딩 '{0}'에 다시 대입할 수 없습니다";
            case Code::kOwnMoveOutOfBorrowed: return "빌린 매개변수 '{0}'에서 값을 이동할 수 없습니다";

            case Code::kAttrMalformed: return "어노테이션 '{0}' 형식 오류: {1}";
            case Code::kDomainWildcardFallback:
                return "함수 '{0}': 네임스페이스 '{1}'의 상태 키를 정적으로 해석할 수 없어 '{2}'(으)로 넓혔습니다 "
                       "(#[reads]/#[writes] 명시를 고려하세요)";
            case Code::kDomainDynamicKeyRejected:
                return "함수 '{0}': 네임스페이스 '{1}'의 상태 키를 정적으로 해석할 수 없고 와일드카드 확장이 비활성화되어 있습니다";
            case Code::kDomainUnderDeclared:
                return "함수 '{0}'이(가) 선언된 #[{1}] 집합에 없는 '{2}'에 접근합니다({1})";
            case Code::kDomainOverDeclared:
                return "함수 '{0}'이(가) #[{1}] '{2}'을(를) 선언했지만 실제로 접근하지 않습니다";

            case Code::kBackendTooManyLocals: return "내부 한계: 함수 '{0}'에 지역 슬롯 {1}개가 필요하지만 타깃은 {2}개까지 허용합니다";
            case Code::kBackendValueTooLarge: return "내부 한계: 함수 '{0}': {1} 크기 {2}이(가) 타깃 한계 {3}을(를) 넘습니다";
            case Code::kBackendUnsupported: return "내부 오류: 함수 '{0}': {1}을(를) 낮출 수 없습니다";

            case Code::kFnExcluded: return "함수 '{0}'이(가) 출력에서 제외되었습니다: {1}";
            case Code::kSsaVerifyFailed: return "내부 오류: '{0}'의 SSA 검증 실패: {1}";
            case Code::kTooManyErrors: return "오류가 너무 많아 중단합니다";
        }
        return "알 수 없는 진단";
    }

    static const char* severity_name_(Severity sev) {
        switch (sev) {
            case Severity::kWarning: return "warning";
            case Severity::kNote:    return "note";
            case Severity::kFatal:   return "fatal";
            case Severity::kError:   return "error";
        }
        return "error";
    }

    static void write_location_(std::ostringstream& oss, const SourceManager& sm, Span sp) {
        const auto lc = sm.line_col(sp.file_id, sp.lo);
        oss << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";

        const auto sn = sm.snippet_for_span(sp);
        if (sn.line_no == 0) return;

        oss << "  |\n";
        oss << sn.line_no << " | " << sn.line_text << "\n";
        oss << "  | " << std::string(sn.caret_cols_before, ' ') << std::string(sn.caret_cols_len, '^') << "\n";
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm) {
        std::ostringstream oss;
        oss << severity_name_(d.severity()) << "[" << code_name(d.code()) << "]: "
            << render_message(d, lang) << "\n";
        write_location_(oss, sm, d.span());

        if (d.has_related()) {
            oss << "note: " << ((lang == Language::kKo) ? "이전 접근 위치" : "previous access here") << "\n";
            write_location_(oss, sm, d.related());
        }
        return oss.str();
    }

    std::string render_json(const Bag& bag, Language lang, const SourceManager& sm) {
        llvm::json::Array arr;
        for (const auto& d : bag.diags()) {
            const auto lc = sm.line_col(d.span().file_id, d.span().lo);

            llvm::json::Object o;
            o["severity"] = severity_name_(d.severity());
            o["code"] = std::string(code_name(d.code()));
            o["message"] = render_message(d, lang);
            o["file"] = std::string(sm.name(d.span().file_id));
            o["line"] = static_cast<int64_t>(lc.line);
            o["col"] = static_cast<int64_t>(lc.col);
            o["lo"] = static_cast<int64_t>(d.span().lo);
            o["hi"] = static_cast<int64_t>(d.span().hi);
            if (d.has_related()) {
                const auto rl = sm.line_col(d.related().file_id, d.related().lo);
                o["related"] = llvm::json::Object{
                    {"line", static_cast<int64_t>(rl.line)},
                    {"col", static_cast<int64_t>(rl.col)},
                };
            }
            arr.push_back(std::move(o));
        }

        std::string out;
        llvm::raw_string_ostream os(out);
        os << llvm::json::Value(std::move(arr));
        os.flush();
        return out;
    }

} // namespace vellum::diag
