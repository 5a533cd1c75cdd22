#ifndef PRSYNC_BUCKETER_H_
#define PRSYNC_BUCKETER_H_

#include <cstdint>
#include <string>
#include <vector>

namespace Prsync {

/**
 * One file of the inventory. Path is relative to the source root.
 */
struct FileEntry {
    std::string path;
    uint64_t size = 0;
};

/**
 * A unit of work for one transfer process.
 * total_size always equals the sum of files[i].size.
 */
struct Bucket {
    int id = 0;
    std::vector<FileEntry> files;
    uint64_t total_size = 0;
};

/**
 * Partitions files into buckets with greedy first-fit, in input order.
 *
 * A file joins the open bucket if it still fits under target_bucket_bytes or if the
 * open bucket is empty; otherwise the open bucket is closed and a new one starts with
 * this file. A file larger than the target therefore lands alone in its own bucket.
 * Buckets are numbered 0..N-1 in creation order. The input is consumed.
 *
 * @param files Inventory, in discovery order
 * @param target_bucket_bytes Nominal bucket size cap
 * @return Ordered buckets; empty when files is empty
 * @throws ConfigError if target_bucket_bytes is 0
 */
std::vector<Bucket> Partition(std::vector<FileEntry> files, uint64_t target_bucket_bytes);

/**
 * Sum of sizes over a bucket sequence.
 */
uint64_t TotalBytes(const std::vector<Bucket>& buckets);

} // namespace Prsync

#endif // PRSYNC_BUCKETER_H_
