#include "flatdb/engine/engine_errors.hpp"

#include <utility>

namespace flatdb::engine {

namespace {

class EngineErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "flatdb.engine";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<EngineErrc>(condition)) {
        case EngineErrc::Success:
            return "success";
        case EngineErrc::DatabaseNotFound:
            return "database not found";
        case EngineErrc::SchemaFileMissing:
            return "schema file missing or not readable";
        case EngineErrc::SchemaFileEmpty:
            return "schema file empty";
        case EngineErrc::MissingTableParam:
            return "missing table name";
        case EngineErrc::TableNotFound:
            return "table not found";
        case EngineErrc::ColumnNotFound:
            return "column name(s) do not exist";
        case EngineErrc::ColumnListMismatch:
            return "column list does not match number of values";
        case EngineErrc::DuplicateKey:
            return "invalid key (not unique)";
        case EngineErrc::AutoKeyOverflow:
            return "cannot assign next key, out of bounds";
        default:
            return "unknown engine error";
        }
    }
};

const EngineErrorCategory kCategory{};

}  // namespace

const std::error_category& engine_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(EngineErrc value) noexcept
{
    return {static_cast<int>(value), engine_error_category()};
}

EngineError::EngineError(EngineErrc code, const std::string& detail, std::vector<std::string> subjects)
    : std::system_error{make_error_code(code), detail}
    , subjects_{std::move(subjects)}
{}

}  // namespace flatdb::engine
