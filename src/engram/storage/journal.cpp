#include "engram/storage/journal.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include "engram/common/logger.h"
#include "engram/core/error.h"

namespace engram {
namespace storage {

namespace {

const std::string kSegmentPrefix = "journal_";
const std::string kSegmentSuffix = ".log";
const std::string kSnapshotPrefix = "snapshot_";
const std::string kSnapshotSuffix = ".bin";

// Safety limits against corrupted length fields
constexpr uint32_t kMaxRecordLength = 256 * 1024 * 1024;
constexpr uint32_t kMaxListLength = 16 * 1024 * 1024;

template<typename T>
void put_raw(std::vector<uint8_t>& out, T value) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&value);
    out.insert(out.end(), bytes, bytes + sizeof(T));
}

void put_string(std::vector<uint8_t>& out, const std::string& s) {
    put_raw<uint32_t>(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

void put_node(std::vector<uint8_t>& out, const core::MemoryNode& node) {
    put_raw<uint64_t>(out, node.id);
    put_string(out, node.owner);
    put_raw<uint8_t>(out, static_cast<uint8_t>(node.level));
    put_string(out, node.content);
    put_raw<uint32_t>(out, static_cast<uint32_t>(node.tags.size()));
    for (const auto& tag : node.tags) {
        put_string(out, tag);
    }
    put_raw<uint32_t>(out, static_cast<uint32_t>(node.similarity_key.size()));
    for (float v : node.similarity_key) {
        put_raw<float>(out, v);
    }
    put_raw<uint8_t>(out, static_cast<uint8_t>(node.consent));
    put_raw<int64_t>(out, node.created_at);
    put_raw<int64_t>(out, node.ttl);
    put_raw<uint64_t>(out, node.access_count);
    put_raw<int64_t>(out, node.last_accessed_at);
    put_raw<float>(out, node.importance);
    put_raw<uint32_t>(out, static_cast<uint32_t>(node.children.size()));
    for (auto child : node.children) {
        put_raw<uint64_t>(out, child);
    }
    put_raw<uint8_t>(out, node.parent.has_value() ? 1 : 0);
    put_raw<uint64_t>(out, node.parent.value_or(0));
}

void put_grant(std::vector<uint8_t>& out, const core::AccessGrant& grant) {
    put_raw<uint64_t>(out, grant.id);
    put_raw<uint64_t>(out, grant.node_id);
    put_string(out, grant.granting_owner);
    put_string(out, grant.receiving_owner);
    put_raw<int64_t>(out, grant.created_at);
    put_raw<int64_t>(out, grant.expires_at);
    put_raw<uint8_t>(out, grant.can_modify ? 1 : 0);
}

void put_edge(std::vector<uint8_t>& out, const core::MemoryEdge& edge) {
    put_raw<uint64_t>(out, edge.id);
    put_raw<uint64_t>(out, edge.source);
    put_raw<uint64_t>(out, edge.target);
    put_string(out, edge.creator);
    put_string(out, edge.relation);
    put_raw<float>(out, edge.weight);
    put_raw<int64_t>(out, edge.created_at);
}

// Bounds checked cursor over one record payload.
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {}

    template<typename T>
    bool get(T& value) {
        if (offset_ + sizeof(T) > data_.size()) {
            return false;
        }
        std::memcpy(&value, data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return true;
    }

    bool get_string(std::string& s) {
        uint32_t len = 0;
        if (!get(len) || offset_ + len > data_.size()) {
            return false;
        }
        s.assign(reinterpret_cast<const char*>(data_.data() + offset_), len);
        offset_ += len;
        return true;
    }

    bool get_node(core::MemoryNode& node) {
        uint8_t level = 0;
        uint8_t consent = 0;
        uint8_t has_parent = 0;
        uint64_t parent = 0;
        uint32_t count = 0;
        if (!get(node.id) || !get_string(node.owner) || !get(level) || !get_string(node.content)) {
            return false;
        }
        if (level >= core::kNumLevels) {
            return false;
        }
        node.level = static_cast<core::Level>(level);
        if (!get(count) || count > kMaxListLength) {
            return false;
        }
        node.tags.resize(count);
        for (auto& tag : node.tags) {
            if (!get_string(tag)) {
                return false;
            }
        }
        if (!get(count) || count > kMaxListLength) {
            return false;
        }
        node.similarity_key.resize(count);
        for (auto& v : node.similarity_key) {
            if (!get(v)) {
                return false;
            }
        }
        if (!get(consent) || consent > static_cast<uint8_t>(core::ConsentLevel::PUBLIC)) {
            return false;
        }
        node.consent = static_cast<core::ConsentLevel>(consent);
        if (!get(node.created_at) || !get(node.ttl) || !get(node.access_count) ||
            !get(node.last_accessed_at) || !get(node.importance)) {
            return false;
        }
        if (!get(count) || count > kMaxListLength) {
            return false;
        }
        node.children.resize(count);
        for (auto& child : node.children) {
            if (!get(child)) {
                return false;
            }
        }
        if (!get(has_parent) || !get(parent)) {
            return false;
        }
        if (has_parent) {
            node.parent = parent;
        } else {
            node.parent.reset();
        }
        return true;
    }

    bool get_grant(core::AccessGrant& grant) {
        uint8_t can_modify = 0;
        if (!get(grant.id) || !get(grant.node_id) || !get_string(grant.granting_owner) ||
            !get_string(grant.receiving_owner) || !get(grant.created_at) || !get(grant.expires_at) ||
            !get(can_modify)) {
            return false;
        }
        grant.can_modify = can_modify != 0;
        return true;
    }

    bool get_edge(core::MemoryEdge& edge) {
        return get(edge.id) && get(edge.source) && get(edge.target) && get_string(edge.creator) &&
               get_string(edge.relation) && get(edge.weight) && get(edge.created_at);
    }

private:
    const std::vector<uint8_t>& data_;
    size_t offset_;
};

std::optional<int> parse_number(const std::string& filename, const std::string& prefix,
                                const std::string& suffix) {
    if (filename.size() <= prefix.size() + suffix.size() ||
        filename.compare(0, prefix.size(), prefix) != 0 ||
        filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    std::string digits = filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    int number = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (ec != std::errc() || end != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return number;
}

} // namespace

JournalRecord JournalRecord::NodePut(const core::MemoryNode& node) {
    JournalRecord r;
    r.type = RecordType::NODE_PUT;
    r.node = node;
    return r;
}

JournalRecord JournalRecord::NodeErase(core::NodeId id) {
    JournalRecord r;
    r.type = RecordType::NODE_ERASE;
    r.id = id;
    return r;
}

JournalRecord JournalRecord::Consent(core::NodeId id, core::ConsentLevel consent) {
    JournalRecord r;
    r.type = RecordType::CONSENT;
    r.id = id;
    r.consent = consent;
    return r;
}

JournalRecord JournalRecord::Ttl(core::NodeId id, core::Duration ttl) {
    JournalRecord r;
    r.type = RecordType::TTL;
    r.id = id;
    r.ttl = ttl;
    return r;
}

JournalRecord JournalRecord::Importance(core::NodeId id, float importance) {
    JournalRecord r;
    r.type = RecordType::IMPORTANCE;
    r.id = id;
    r.importance = importance;
    return r;
}

JournalRecord JournalRecord::Touch(core::NodeId id, uint64_t access_count, core::Timestamp at) {
    JournalRecord r;
    r.type = RecordType::TOUCH;
    r.id = id;
    r.access_count = access_count;
    r.timestamp = at;
    return r;
}

JournalRecord JournalRecord::SummaryCommit(const core::MemoryNode& summary) {
    JournalRecord r;
    r.type = RecordType::SUMMARY_COMMIT;
    r.node = summary;
    return r;
}

JournalRecord JournalRecord::GrantPut(const core::AccessGrant& grant) {
    JournalRecord r;
    r.type = RecordType::GRANT_PUT;
    r.grant = grant;
    return r;
}

JournalRecord JournalRecord::GrantErase(core::GrantId id) {
    JournalRecord r;
    r.type = RecordType::GRANT_ERASE;
    r.id = id;
    return r;
}

JournalRecord JournalRecord::EdgePut(const core::MemoryEdge& edge) {
    JournalRecord r;
    r.type = RecordType::EDGE_PUT;
    r.edge = edge;
    return r;
}

JournalRecord JournalRecord::EdgeErase(core::EdgeId id) {
    JournalRecord r;
    r.type = RecordType::EDGE_ERASE;
    r.id = id;
    return r;
}

JournalRecord JournalRecord::IdWatermark(core::NodeId next_node, core::GrantId next_grant,
                                         core::EdgeId next_edge) {
    JournalRecord r;
    r.type = RecordType::ID_WATERMARK;
    r.id = next_node;
    r.grant.id = next_grant;
    r.edge.id = next_edge;
    return r;
}

std::vector<uint8_t> serialize_record(const JournalRecord& record) {
    std::vector<uint8_t> out;
    put_raw<uint8_t>(out, static_cast<uint8_t>(record.type));

    switch (record.type) {
        case RecordType::NODE_PUT:
        case RecordType::SUMMARY_COMMIT:
            put_node(out, record.node);
            break;
        case RecordType::NODE_ERASE:
        case RecordType::GRANT_ERASE:
        case RecordType::EDGE_ERASE:
            put_raw<uint64_t>(out, record.id);
            break;
        case RecordType::CONSENT:
            put_raw<uint64_t>(out, record.id);
            put_raw<uint8_t>(out, static_cast<uint8_t>(record.consent));
            break;
        case RecordType::TTL:
            put_raw<uint64_t>(out, record.id);
            put_raw<int64_t>(out, record.ttl);
            break;
        case RecordType::IMPORTANCE:
            put_raw<uint64_t>(out, record.id);
            put_raw<float>(out, record.importance);
            break;
        case RecordType::TOUCH:
            put_raw<uint64_t>(out, record.id);
            put_raw<uint64_t>(out, record.access_count);
            put_raw<int64_t>(out, record.timestamp);
            break;
        case RecordType::GRANT_PUT:
            put_grant(out, record.grant);
            break;
        case RecordType::EDGE_PUT:
            put_edge(out, record.edge);
            break;
        case RecordType::ID_WATERMARK:
            put_raw<uint64_t>(out, record.id);
            put_raw<uint64_t>(out, record.grant.id);
            put_raw<uint64_t>(out, record.edge.id);
            break;
    }
    return out;
}

std::optional<JournalRecord> deserialize_record(const std::vector<uint8_t>& data) {
    Reader reader(data);
    uint8_t type = 0;
    if (!reader.get(type)) {
        return std::nullopt;
    }

    JournalRecord record;
    record.type = static_cast<RecordType>(type);
    bool ok = false;
    switch (record.type) {
        case RecordType::NODE_PUT:
        case RecordType::SUMMARY_COMMIT:
            ok = reader.get_node(record.node);
            break;
        case RecordType::NODE_ERASE:
        case RecordType::GRANT_ERASE:
        case RecordType::EDGE_ERASE:
            ok = reader.get(record.id);
            break;
        case RecordType::CONSENT: {
            uint8_t consent = 0;
            ok = reader.get(record.id) && reader.get(consent) &&
                 consent <= static_cast<uint8_t>(core::ConsentLevel::PUBLIC);
            record.consent = static_cast<core::ConsentLevel>(consent);
            break;
        }
        case RecordType::TTL:
            ok = reader.get(record.id) && reader.get(record.ttl);
            break;
        case RecordType::IMPORTANCE:
            ok = reader.get(record.id) && reader.get(record.importance);
            break;
        case RecordType::TOUCH:
            ok = reader.get(record.id) && reader.get(record.access_count) && reader.get(record.timestamp);
            break;
        case RecordType::GRANT_PUT:
            ok = reader.get_grant(record.grant);
            break;
        case RecordType::EDGE_PUT:
            ok = reader.get_edge(record.edge);
            break;
        case RecordType::ID_WATERMARK:
            ok = reader.get(record.id) && reader.get(record.grant.id) && reader.get(record.edge.id);
            break;
        default:
            ok = false;
            break;
    }
    if (!ok) {
        return std::nullopt;
    }
    return record;
}

Journal::Journal(const std::string& dir, const core::JournalConfig& config)
    : journal_dir_(dir), config_(config), current_segment_(0) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw core::StorageUnavailableError("Failed to create journal directory " + dir + ": " + ec.message());
    }

    // Continue appending to the newest segment.
    auto segments = list_files(kSegmentPrefix, kSegmentSuffix);
    auto snapshots = list_files(kSnapshotPrefix, kSnapshotSuffix);
    int newest_snapshot = snapshots.empty() ? 0 : snapshots.back().first;
    if (!segments.empty()) {
        current_segment_ = std::max(segments.back().first, newest_snapshot);
    } else {
        current_segment_ = newest_snapshot;
    }

    // Records appended after a torn tail would be unreachable on replay.
    if (!segments.empty() && segments.back().first == current_segment_) {
        drop_torn_tail(segments.back().second);
    }

    uint64_t pending = 0;
    for (const auto& [number, path] : segments) {
        if (number >= newest_snapshot) {
            pending += std::filesystem::file_size(path, ec);
            if (ec) {
                ec.clear();
            }
        }
    }
    bytes_since_checkpoint_.store(pending);

    std::string segment_path = get_segment_path(current_segment_);
    current_file_.open(segment_path, std::ios::binary | std::ios::app);
    if (!current_file_.is_open() || !current_file_.good()) {
        throw core::StorageUnavailableError("Failed to open journal segment file: " + segment_path);
    }
}

Journal::~Journal() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

core::Result<void> Journal::log(const JournalRecord& record, bool flush_now) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto serialized = serialize_record(record);
        if (!write_to_segment(serialized, flush_now && config_.sync_writes)) {
            return core::Result<void>::error("Failed to write to journal segment " + get_segment_path(current_segment_),
                                             core::Error::Code::STORAGE_UNAVAILABLE);
        }
        bytes_since_checkpoint_.fetch_add(serialized.size() + sizeof(uint32_t));

        if (static_cast<size_t>(current_file_.tellp()) > config_.segment_size_bytes) {
            rotate_segment();
        }
        return core::Result<void>();
    } catch (const std::exception& e) {
        return core::Result<void>::error("Journal log failed: " + std::string(e.what()),
                                         core::Error::Code::STORAGE_UNAVAILABLE);
    }
}

core::Result<void> Journal::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_file_.is_open()) {
        current_file_.flush();
        if (!current_file_.good()) {
            return core::Result<void>::error("Failed to flush journal", core::Error::Code::STORAGE_UNAVAILABLE);
        }
    }
    return core::Result<void>();
}

core::Result<void> Journal::replay(const RecordSink& callback) {
    try {
        if (current_file_.is_open()) {
            current_file_.flush();
        }

        auto snapshots = list_files(kSnapshotPrefix, kSnapshotSuffix);
        int start_segment = 0;
        size_t replayed = 0;

        // Newest readable snapshot wins; a damaged one falls back to the previous.
        for (auto it = snapshots.rbegin(); it != snapshots.rend(); ++it) {
            std::vector<JournalRecord> buffered;
            auto result = replay_file(it->second, [&buffered](const JournalRecord& r) {
                buffered.push_back(r);
            });
            if (!result.ok()) {
                ENGRAM_WARN("Skipping unreadable snapshot {}: {}", it->second, result.error());
                continue;
            }
            for (const auto& r : buffered) {
                callback(r);
            }
            replayed += buffered.size();
            start_segment = it->first;
            break;
        }

        for (const auto& [number, path] : list_files(kSegmentPrefix, kSegmentSuffix)) {
            if (number < start_segment) {
                continue;
            }
            auto result = replay_file(path, callback);
            if (!result.ok()) {
                return core::Result<void>::error(result.error(), core::Error::Code::STORAGE_UNAVAILABLE);
            }
            replayed += result.value();
        }

        ENGRAM_DEBUG("Journal replayed {} records from {}", replayed, journal_dir_);
        return core::Result<void>();
    } catch (const std::exception& e) {
        return core::Result<void>::error("Journal replay failed: " + std::string(e.what()),
                                         core::Error::Code::STORAGE_UNAVAILABLE);
    }
}

core::Result<int> Journal::rotate_for_checkpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        rotate_segment();
        bytes_since_checkpoint_.store(0);
        return core::Result<int>(current_segment_);
    } catch (const std::exception& e) {
        return core::Result<int>::error("Journal rotation failed: " + std::string(e.what()),
                                        core::Error::Code::STORAGE_UNAVAILABLE);
    }
}

core::Result<void> Journal::write_snapshot(int segment, const std::function<void(const RecordSink&)>& produce) {
    const std::string final_path = get_snapshot_path(segment);
    const std::string tmp_path = final_path + ".tmp";

    try {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Result<void>::error("Failed to open snapshot file: " + tmp_path,
                                             core::Error::Code::STORAGE_UNAVAILABLE);
        }

        size_t count = 0;
        produce([&out, &count](const JournalRecord& record) {
            auto data = serialize_record(record);
            uint32_t length = static_cast<uint32_t>(data.size());
            out.write(reinterpret_cast<const char*>(&length), sizeof(length));
            out.write(reinterpret_cast<const char*>(data.data()), data.size());
            ++count;
        });
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp_path);
            return core::Result<void>::error("Failed to write snapshot file: " + tmp_path,
                                             core::Error::Code::STORAGE_UNAVAILABLE);
        }
        out.close();

        std::filesystem::rename(tmp_path, final_path);
        drop_files_before(segment);

        ENGRAM_INFO("Journal checkpoint {} written with {} records", final_path, count);
        return core::Result<void>();
    } catch (const std::exception& e) {
        return core::Result<void>::error("Journal checkpoint failed: " + std::string(e.what()),
                                         core::Error::Code::STORAGE_UNAVAILABLE);
    }
}

int Journal::current_segment() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_segment_;
}

bool Journal::write_to_segment(const std::vector<uint8_t>& data, bool flush_now) {
    if (!current_file_.is_open()) {
        return false;
    }

    // Write data length first
    uint32_t data_length = static_cast<uint32_t>(data.size());
    current_file_.write(reinterpret_cast<const char*>(&data_length), sizeof(data_length));
    current_file_.write(reinterpret_cast<const char*>(data.data()), data.size());

    if (flush_now) {
        current_file_.flush();
    }
    return current_file_.good();
}

void Journal::rotate_segment() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }

    current_segment_++;
    current_file_.open(get_segment_path(current_segment_), std::ios::binary | std::ios::app);

    if (!current_file_.is_open()) {
        throw core::StorageUnavailableError("Failed to open new journal segment file");
    }
}

std::string Journal::get_segment_path(int segment) const {
    std::ostringstream oss;
    oss << journal_dir_ << "/" << kSegmentPrefix << std::setfill('0') << std::setw(6) << segment << kSegmentSuffix;
    return oss.str();
}

std::string Journal::get_snapshot_path(int segment) const {
    std::ostringstream oss;
    oss << journal_dir_ << "/" << kSnapshotPrefix << std::setfill('0') << std::setw(6) << segment << kSnapshotSuffix;
    return oss.str();
}

std::vector<std::pair<int, std::string>> Journal::list_files(const std::string& prefix,
                                                             const std::string& suffix) const {
    std::vector<std::pair<int, std::string>> files;
    std::error_code ec;
    if (!std::filesystem::exists(journal_dir_, ec)) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(journal_dir_, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto number = parse_number(entry.path().filename().string(), prefix, suffix);
        if (number.has_value()) {
            files.emplace_back(*number, entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

core::Result<size_t> Journal::replay_file(const std::string& path, const RecordSink& callback) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result<size_t>::error("Failed to open journal file for replay: " + path,
                                           core::Error::Code::STORAGE_UNAVAILABLE);
    }

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    file.seekg(0, std::ios::beg);

    size_t count = 0;
    while (true) {
        std::streampos current_pos = file.tellg();
        if (current_pos < 0 || current_pos + static_cast<std::streampos>(sizeof(uint32_t)) > file_size) {
            break;
        }

        uint32_t data_length = 0;
        file.read(reinterpret_cast<char*>(&data_length), sizeof(data_length));
        if (file.gcount() != sizeof(data_length)) {
            break;
        }
        if (data_length == 0 || data_length > kMaxRecordLength) {
            ENGRAM_WARN("Corrupted record length {} in {}, stopping replay of this file", data_length, path);
            break;
        }
        std::streampos expected_end = current_pos + static_cast<std::streampos>(sizeof(uint32_t) + data_length);
        if (expected_end > file_size) {
            // Truncated tail from an interrupted append
            ENGRAM_WARN("Truncated record at end of {}", path);
            break;
        }

        std::vector<uint8_t> data(data_length);
        file.read(reinterpret_cast<char*>(data.data()), data_length);
        if (file.gcount() != static_cast<std::streamsize>(data_length)) {
            break;
        }

        auto record = deserialize_record(data);
        if (!record.has_value()) {
            ENGRAM_WARN("Skipping undecodable record in {}", path);
            continue;
        }
        callback(*record);
        ++count;
    }
    return core::Result<size_t>(count);
}

uint64_t Journal::complete_prefix_length(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw core::StorageUnavailableError("Failed to open journal segment for scan: " + path);
    }
    file.seekg(0, std::ios::end);
    const uint64_t file_size = static_cast<uint64_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    uint64_t offset = 0;
    while (offset + sizeof(uint32_t) <= file_size) {
        uint32_t data_length = 0;
        file.read(reinterpret_cast<char*>(&data_length), sizeof(data_length));
        if (file.gcount() != sizeof(data_length) || data_length == 0 || data_length > kMaxRecordLength) {
            break;
        }
        const uint64_t next = offset + sizeof(uint32_t) + data_length;
        if (next > file_size) {
            break;
        }
        file.seekg(static_cast<std::streamoff>(next), std::ios::beg);
        offset = next;
    }
    return offset;
}

void Journal::drop_torn_tail(const std::string& path) {
    const uint64_t valid = complete_prefix_length(path);
    std::error_code ec;
    const uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw core::StorageUnavailableError("Failed to stat journal segment " + path + ": " + ec.message());
    }
    if (valid == size) {
        return;
    }
    ENGRAM_WARN("Cutting {} bytes of torn tail from {}", size - valid, path);
    std::filesystem::resize_file(path, valid, ec);
    if (ec) {
        throw core::StorageUnavailableError("Failed to truncate journal segment " + path + ": " + ec.message());
    }
}

void Journal::drop_files_before(int segment) {
    std::error_code ec;
    for (const auto& [number, path] : list_files(kSegmentPrefix, kSegmentSuffix)) {
        if (number < segment) {
            std::filesystem::remove(path, ec);
        }
    }
    for (const auto& [number, path] : list_files(kSnapshotPrefix, kSnapshotSuffix)) {
        if (number < segment) {
            std::filesystem::remove(path, ec);
        }
    }
}

} // namespace storage
} // namespace engram
