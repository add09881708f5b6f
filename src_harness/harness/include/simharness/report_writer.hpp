#pragma once

#include <filesystem>
#include <string>

#include "batch_driver.hpp"

namespace simharness {

/**
 * \brief Emits a machine-readable record of a batch run.
 *
 * - write_summary(): JSON document with per-case results and aggregate counts.
 * - render_console(): the short plain-text summary printed at the end of a run.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_summary(const std::filesystem::path& destination, const BatchReport& report) const;

    [[nodiscard]] std::string render_summary(const BatchReport& report) const;

    [[nodiscard]] std::string render_console(const BatchReport& report) const;
};

}  // namespace simharness
