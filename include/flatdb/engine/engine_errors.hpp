#pragma once

#include <string>
#include <system_error>
#include <vector>

namespace flatdb::engine {

enum class EngineErrc {
    Success = 0,
    DatabaseNotFound,
    SchemaFileMissing,
    SchemaFileEmpty,
    MissingTableParam,
    TableNotFound,
    ColumnNotFound,
    ColumnListMismatch,
    DuplicateKey,
    AutoKeyOverflow
};

const std::error_category& engine_error_category() noexcept;
std::error_code make_error_code(EngineErrc value) noexcept;

// Domain failure raised by the query engine. subjects() names what the error
// is about: offending columns, the duplicate key, the missing table.
class EngineError final : public std::system_error {
public:
    EngineError(EngineErrc code, const std::string& detail, std::vector<std::string> subjects = {});

    [[nodiscard]] EngineErrc errc() const noexcept { return static_cast<EngineErrc>(code().value()); }
    [[nodiscard]] const std::vector<std::string>& subjects() const noexcept { return subjects_; }

private:
    std::vector<std::string> subjects_{};
};

}  // namespace flatdb::engine

namespace std {

template <>
struct is_error_code_enum<flatdb::engine::EngineErrc> : true_type {
};

}  // namespace std
