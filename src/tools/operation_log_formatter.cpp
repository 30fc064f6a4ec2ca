#include "flatdb/tools/operation_log_formatter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

void append_json_string(std::string& out, const std::string& text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

}  // namespace

namespace flatdb::tools {

std::string format_operation_log_json(const flatdb::engine::OperationRecord& record)
{
    std::string json;
    json.reserve(256U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_string_field = [&](const char* name, const std::string& value) {
        append_field(name);
        append_json_string(json, value);
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    auto append_timestamp_field = [&](const char* name, std::chrono::system_clock::time_point value) {
        const auto text = format_timestamp_iso(value);
        append_field(name);
        if (text.empty()) {
            json.append("null");
        } else {
            append_json_string(json, text);
        }
    };

    append_string_field("operation", flatdb::engine::operation_kind_name(record.kind));
    append_string_field("database", record.database);
    append_string_field("table", record.table);
    append_field("success");
    json.append(record.success ? "true" : "false");
    append_number_field("rows_read", record.rows_read);
    append_number_field("rows_affected", record.rows_affected);
    append_number_field("duration_ms", record.duration_ms);
    append_timestamp_field("started_at", record.started_at);
    append_timestamp_field("finished_at", record.finished_at);

    append_field("error");
    if (record.success) {
        json.append("null");
    } else {
        json.push_back('{');
        json.append("\"category\":");
        append_json_string(json, record.error ? std::string{record.error.category().name()} : std::string{});
        json.append(",\"code\":");
        json.append(std::to_string(record.error.value()));
        json.append(",\"message\":");
        append_json_string(json, record.error_message);
        json.push_back('}');
    }

    json.push_back('}');
    return json;
}

}  // namespace flatdb::tools
