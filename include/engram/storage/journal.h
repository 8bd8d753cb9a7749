#ifndef ENGRAM_STORAGE_JOURNAL_H_
#define ENGRAM_STORAGE_JOURNAL_H_

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engram/core/config.h"
#include "engram/core/result.h"
#include "engram/core/types.h"

namespace engram {
namespace storage {

/**
 * @brief Kinds of state change recorded in the journal
 *
 * Every record carries absolute values so that replaying a record whose
 * effect is already part of a snapshot leaves the state unchanged.
 */
enum class RecordType : uint8_t {
    NODE_PUT = 1,
    NODE_ERASE = 2,
    CONSENT = 3,
    TTL = 4,
    IMPORTANCE = 5,
    TOUCH = 6,
    SUMMARY_COMMIT = 7,  // summary node; its children gain it as parent
    GRANT_PUT = 8,
    GRANT_ERASE = 9,
    EDGE_PUT = 10,
    EDGE_ERASE = 11,
    ID_WATERMARK = 12    // next node / grant / edge ids, written by snapshots
};

struct JournalRecord {
    RecordType type = RecordType::NODE_PUT;
    core::MemoryNode node;
    core::AccessGrant grant;
    core::MemoryEdge edge;
    uint64_t id = 0;  // node, grant or edge id for the scalar record types
    core::ConsentLevel consent = core::ConsentLevel::PRIVATE;
    core::Duration ttl = 0;
    float importance = 0.0f;
    uint64_t access_count = 0;
    core::Timestamp timestamp = 0;

    static JournalRecord NodePut(const core::MemoryNode& node);
    static JournalRecord NodeErase(core::NodeId id);
    static JournalRecord Consent(core::NodeId id, core::ConsentLevel consent);
    static JournalRecord Ttl(core::NodeId id, core::Duration ttl);
    static JournalRecord Importance(core::NodeId id, float importance);
    static JournalRecord Touch(core::NodeId id, uint64_t access_count, core::Timestamp at);
    static JournalRecord SummaryCommit(const core::MemoryNode& summary);
    static JournalRecord GrantPut(const core::AccessGrant& grant);
    static JournalRecord GrantErase(core::GrantId id);
    static JournalRecord EdgePut(const core::MemoryEdge& edge);
    static JournalRecord EdgeErase(core::EdgeId id);
    static JournalRecord IdWatermark(core::NodeId next_node, core::GrantId next_grant, core::EdgeId next_edge);
};

using RecordSink = std::function<void(const JournalRecord&)>;

/**
 * @brief Segmented write-ahead log with snapshot checkpoints
 *
 * Layout under the journal directory:
 *   journal_NNNNNN.log   length-prefixed records, appended
 *   snapshot_NNNNNN.bin  full state as of the start of segment NNNNNN
 *
 * Recovery loads the newest snapshot and replays segments numbered at or
 * after it.
 */
class Journal {
public:
    // Throws core::StorageUnavailableError when the directory or the
    // active segment cannot be opened.
    Journal(const std::string& dir, const core::JournalConfig& config);
    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    core::Result<void> log(const JournalRecord& record, bool flush_now = true);
    core::Result<void> flush();

    // Used on startup, single threaded.
    core::Result<void> replay(const RecordSink& callback);

    /**
     * @brief Starts a checkpoint by switching to a fresh segment
     * @return Number of the new segment; the snapshot is written for it
     */
    core::Result<int> rotate_for_checkpoint();

    /**
     * @brief Writes the snapshot for @p segment and drops older files
     * @param produce Called once with a sink that receives every live record
     */
    core::Result<void> write_snapshot(int segment, const std::function<void(const RecordSink&)>& produce);

    uint64_t bytes_since_checkpoint() const { return bytes_since_checkpoint_.load(); }
    int current_segment() const;
    const std::string& dir() const { return journal_dir_; }

private:
    std::string journal_dir_;
    core::JournalConfig config_;
    int current_segment_;
    std::ofstream current_file_;
    std::atomic<uint64_t> bytes_since_checkpoint_{0};
    mutable std::mutex mutex_;  // Protects the active segment

    bool write_to_segment(const std::vector<uint8_t>& data, bool flush_now);
    void rotate_segment();
    std::string get_segment_path(int segment) const;
    std::string get_snapshot_path(int segment) const;
    std::vector<std::pair<int, std::string>> list_files(const std::string& prefix,
                                                        const std::string& suffix) const;
    core::Result<size_t> replay_file(const std::string& path, const RecordSink& callback);
    // Byte length of the leading run of well-framed records.
    static uint64_t complete_prefix_length(const std::string& path);
    void drop_torn_tail(const std::string& path);
    void drop_files_before(int segment);
};

// Record codec, exposed for tests.
std::vector<uint8_t> serialize_record(const JournalRecord& record);
std::optional<JournalRecord> deserialize_record(const std::vector<uint8_t>& data);

} // namespace storage
} // namespace engram

#endif // ENGRAM_STORAGE_JOURNAL_H_
