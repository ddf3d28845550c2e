#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for simulation output.
///
/// A no-op writer, a streaming JSON writer, an in-memory buffer used by
/// tests and metrics, and a human-readable line writer.
///
/// @ingroup io_writers

#include <staffsim/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace staffsim::io {

/// @brief Trace writer that discards every record.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Streams records as a JSON array of objects.
///
/// Each record becomes `{"time": <seconds>, "type": "...", <fields>}`.
/// The array is closed by finalize(), or by the destructor if finalize()
/// was never called.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output Destination stream; must outlive the writer.
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the JSON array. Further calls are ignored.
    void finalize();

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    bool finalized_{false};
};

/// @brief One buffered trace record.
/// @ingroup io_writers
/// @see MemoryTraceWriter, compute_metrics
struct TraceRecord {
    using Value = std::variant<double, uint64_t, std::string>;

    double time;        ///< Simulation time in seconds.
    std::string type;   ///< Record type, e.g. "job_claimed".
    std::unordered_map<std::string, Value> fields;

    /// @name Typed field lookup
    /// Return std::nullopt when the field is missing or holds another type.
    /// @{
    [[nodiscard]] std::optional<uint64_t> get_uint(const std::string& key) const;
    [[nodiscard]] std::optional<double> get_double(const std::string& key) const;
    [[nodiscard]] std::optional<std::string> get_string(const std::string& key) const;
    /// @}
};

/// @brief Keeps every record in memory for later inspection.
/// @ingroup io_writers
/// @see TraceRecord, compute_metrics
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }
    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief One aligned line per record, optionally coloured by record type.
///
/// Line format: `[   12.30000] (+   0.10000)   job_claimed: job_id = 4, ...`.
/// Completions print green, failures and discards red, abandonments
/// yellow when colour is enabled.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output        Destination stream; must outlive the writer.
    /// @param color_enabled Emit ANSI colour codes.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    [[nodiscard]] std::string_view color_for(std::string_view type) const;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    double current_time_{0.0};
    std::optional<double> prev_time_;
    std::string current_type_;
    std::vector<std::pair<std::string, std::string>> current_fields_;
};

/// @brief Forwards every call to two writers, e.g. a file and a memory buffer.
/// @ingroup io_writers
class TeeTraceWriter : public core::TraceWriter {
public:
    /// Both writers are non-owning and must outlive the tee.
    TeeTraceWriter(core::TraceWriter& first, core::TraceWriter& second)
        : first_(first), second_(second) {}

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    core::TraceWriter& first_;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::TraceWriter& second_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace staffsim::io
