#ifndef PRSYNC_REPORT_WRITER_H_
#define PRSYNC_REPORT_WRITER_H_

#include <string>

#include "transfer_report.h"

namespace Prsync {

/**
 * Persists a TransferReport as YAML so failed buckets can be inspected and re-run
 * (prsync --only-buckets) later.
 */
class ReportWriter {
public:
    /**
     * @param path Output file; parent directories are created as needed
     */
    explicit ReportWriter(std::string path);

    /**
     * @return false if the file could not be written; the reason is logged
     */
    bool Write(const TransferReport& report) const;

    // The YAML document Write() would produce
    static std::string ToYAML(const TransferReport& report);

private:
    std::string path_;
};

/**
 * Logs the end-of-run summary: elapsed time, bucket counts, and for every failed
 * bucket its reason and the last lines of its output.
 */
void LogReport(const TransferReport& report);

} // namespace Prsync

#endif // PRSYNC_REPORT_WRITER_H_
