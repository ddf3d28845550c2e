#include <staffsim/io/trace_writers.hpp>

#include <iomanip>
#include <sstream>

namespace staffsim::io {

namespace {

constexpr std::string_view ANSI_RESET  = "\033[0m";
constexpr std::string_view ANSI_RED    = "\033[31m";
constexpr std::string_view ANSI_GREEN  = "\033[32m";
constexpr std::string_view ANSI_YELLOW = "\033[33m";
constexpr std::string_view ANSI_CYAN   = "\033[36m";

template<typename T>
std::optional<T> get_as(const TraceRecord& record, const std::string& key) {
    auto it = record.fields.find(key);
    if (it == record.fields.end()) {
        return std::nullopt;
    }
    if (const T* value = std::get_if<T>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

} // namespace

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::TimePoint /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    writer_.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::key(std::string_view name) {
    writer_.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::begin(core::TimePoint time) {
    writer_.StartObject();
    key("time");
    writer_.Double(core::time_to_seconds(time));
}

void JsonTraceWriter::type(std::string_view name) {
    key("type");
    writer_.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::field(std::string_view name, double value) {
    key(name);
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view name, uint64_t value) {
    key(name);
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view name, std::string_view value) {
    key(name);
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    writer_.EndObject();
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    writer_.EndArray();
    output_ << '\n';
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

std::optional<uint64_t> TraceRecord::get_uint(const std::string& key) const {
    return get_as<uint64_t>(*this, key);
}

std::optional<double> TraceRecord::get_double(const std::string& key) const {
    return get_as<double>(*this, key);
}

std::optional<std::string> TraceRecord::get_string(const std::string& key) const {
    return get_as<std::string>(*this, key);
}

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_seconds(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    current_time_ = core::time_to_seconds(time);
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.emplace_back(std::string(key), oss.str());
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.emplace_back(std::string(key), std::to_string(value));
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.emplace_back(std::string(key), std::string(value));
}

std::string_view TextualTraceWriter::color_for(std::string_view type) const {
    if (type == "job_completed") {
        return ANSI_GREEN;
    }
    if (type == "job_failed" || type == "job_discarded") {
        return ANSI_RED;
    }
    if (type == "job_abandoned" || type == "job_cancelled" || type == "zone_removed") {
        return ANSI_YELLOW;
    }
    if (type == "job_claimed") {
        return ANSI_CYAN;
    }
    return {};
}

void TextualTraceWriter::end() {
    output_ << "[" << std::setw(11) << std::fixed << std::setprecision(5)
            << current_time_ << "] ";

    if (prev_time_ && current_time_ != *prev_time_) {
        output_ << "(+" << std::setw(10) << std::fixed << std::setprecision(5)
                << (current_time_ - *prev_time_) << ") ";
    } else {
        output_ << "(           ) ";
    }

    std::string_view color = color_enabled_ ? color_for(current_type_) : std::string_view{};
    output_ << color << std::setw(16) << std::right << current_type_
            << (color.empty() ? std::string_view{} : ANSI_RESET) << ":";

    bool first = true;
    for (const auto& [key, value] : current_fields_) {
        output_ << (first ? " " : ", ") << key << " = " << value;
        first = false;
    }
    output_ << "\n";
    prev_time_ = current_time_;
}

// =============================================================================
// TeeTraceWriter
// =============================================================================

void TeeTraceWriter::begin(core::TimePoint time) {
    first_.begin(time);
    second_.begin(time);
}

void TeeTraceWriter::type(std::string_view name) {
    first_.type(name);
    second_.type(name);
}

void TeeTraceWriter::field(std::string_view key, double value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::field(std::string_view key, uint64_t value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::field(std::string_view key, std::string_view value) {
    first_.field(key, value);
    second_.field(key, value);
}

void TeeTraceWriter::end() {
    first_.end();
    second_.end();
}

} // namespace staffsim::io
