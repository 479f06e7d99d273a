#include "log_tailer.hpp"
#include "log.hpp"
#include "util.hpp"

#include <sys/stat.h>

#include <fstream>
#include <nlohmann/json.hpp>

namespace rconbridge {

static uint64_t fnv1a64(const std::string& data) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

// Up to len bytes ending at end, or nullopt when the file cannot be read.
static std::optional<std::string> read_before(const std::string& path, uint64_t end,
                                              uint64_t len) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    if (len > end) len = end;
    std::string buf(static_cast<size_t>(len), '\0');
    file.seekg(static_cast<std::streamoff>(end - len));
    file.read(&buf[0], static_cast<std::streamsize>(len));
    if (static_cast<uint64_t>(file.gcount()) != len) return std::nullopt;
    return buf;
}

std::optional<TailCheckpoint> load_tail_checkpoint(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    try {
        auto j = nlohmann::json::parse(file);
        TailCheckpoint cp;
        cp.dev = j.at("dev").get<uint64_t>();
        cp.ino = j.at("ino").get<uint64_t>();
        cp.offset = j.at("offset").get<uint64_t>();
        cp.marker_len = j.value("marker_len", uint64_t{0});
        cp.marker_hash = j.value("marker_hash", uint64_t{0});
        return cp;
    } catch (const nlohmann::json::exception& e) {
        log_warn("tailer", "Ignoring unreadable checkpoint " + path + ": " + e.what());
        return std::nullopt;
    }
}

bool save_tail_checkpoint(const std::string& path, const TailCheckpoint& checkpoint) {
    nlohmann::json j = {
        {"dev", checkpoint.dev},
        {"ino", checkpoint.ino},
        {"offset", checkpoint.offset},
        {"marker_len", checkpoint.marker_len},
        {"marker_hash", checkpoint.marker_hash}
    };
    return atomic_write_file(path, j.dump() + "\n");
}

LogTailer::LogTailer(std::string path, std::string checkpoint_path, bool start_at_end,
                     EventBus* bus)
    : path_(std::move(path))
    , checkpoint_path_(std::move(checkpoint_path))
    , start_at_end_(start_at_end)
    , bus_(bus)
{
    if (!checkpoint_path_.empty()) known_ = load_tail_checkpoint(checkpoint_path_);
}

bool LogTailer::save_checkpoint() const {
    if (checkpoint_path_.empty() || state_ != State::Following) return true;
    TailCheckpoint cp{dev_, ino_, offset_, marker_len_, marker_hash_};
    if (!save_tail_checkpoint(checkpoint_path_, cp)) {
        log_warn("tailer", "Failed to write checkpoint " + checkpoint_path_);
        return false;
    }
    return true;
}

void LogTailer::capture_marker() {
    marker_len_ = 0;
    marker_hash_ = 0;
    if (offset_ == 0) return;
    auto bytes = read_before(path_, offset_, MARKER_BYTES);
    if (!bytes) return;
    marker_len_ = bytes->size();
    marker_hash_ = fnv1a64(*bytes);
}

bool LogTailer::marker_matches() const {
    // Checkpoints written before markers existed carry none
    if (offset_ == 0 || marker_len_ == 0) return true;
    auto bytes = read_before(path_, offset_, marker_len_);
    return bytes && fnv1a64(*bytes) == marker_hash_;
}

void LogTailer::rotate(const char* reason) {
    offset_ = 0;
    marker_len_ = 0;
    marker_hash_ = 0;
    uint64_t n = ++rotations_;
    log_warn("tailer", path_ + " was " + reason + ", reading from the start");
    LogRotatedEvent ev;
    ev.path = path_;
    ev.reason = reason;
    ev.rotations = n;
    publish_if(bus_, ev);
}

std::vector<LogEvent> LogTailer::poll() {
    bool first = first_poll_;
    first_poll_ = false;

    struct stat st;
    if (::stat(path_.c_str(), &st) != 0) {
        if (state_ == State::Following) {
            known_ = TailCheckpoint{dev_, ino_, offset_, marker_len_, marker_hash_};
            state_ = State::Seeking;
        }
        if (!missing_reported_) {
            missing_reported_ = true;
            missing_++;
            log_warn("tailer", "Waiting for " + path_ + " to appear");
        }
        return {};
    }
    missing_reported_ = false;

    uint64_t dev = static_cast<uint64_t>(st.st_dev);
    uint64_t ino = static_cast<uint64_t>(st.st_ino);
    uint64_t size = static_cast<uint64_t>(st.st_size);

    if (state_ == State::Seeking) {
        dev_ = dev;
        ino_ = ino;
        if (known_ && known_->dev == dev && known_->ino == ino && known_->offset <= size) {
            offset_ = known_->offset;
            marker_len_ = known_->marker_len;
            marker_hash_ = known_->marker_hash;
            if (!marker_matches()) rotate("truncated");
        } else if (known_) {
            rotate(known_->dev == dev && known_->ino == ino ? "truncated" : "replaced");
        } else {
            offset_ = first && start_at_end_ ? size : 0;
            capture_marker();
        }
        known_.reset();
        state_ = State::Following;
        log_info("tailer", "Following " + path_ + " from offset " + std::to_string(offset_));
    } else if (dev != dev_ || ino != ino_) {
        dev_ = dev;
        ino_ = ino;
        rotate("replaced");
    } else if (size < offset_ || !marker_matches()) {
        rotate("truncated");
    }

    if (size <= offset_) return {};
    uint64_t before = offset_;
    auto events = read_new_lines(size);
    if (offset_ != before) save_checkpoint();
    return events;
}

std::vector<LogEvent> LogTailer::read_new_lines(uint64_t file_size) {
    std::vector<LogEvent> events;
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) return events;

    uint64_t want = file_size - offset_;
    if (want > MAX_READ) want = MAX_READ;
    std::string buf(static_cast<size_t>(want), '\0');
    file.seekg(static_cast<std::streamoff>(offset_));
    file.read(&buf[0], static_cast<std::streamsize>(want));
    buf.resize(static_cast<size_t>(file.gcount()));

    uint64_t now = epoch_seconds();
    size_t start = 0;
    size_t nl;
    while ((nl = buf.find('\n', start)) != std::string::npos) {
        LogEvent ev;
        ev.raw_line = buf.substr(start, nl - start);
        ev.byte_offset = offset_ + start;
        ev.timestamp = now;
        events.push_back(std::move(ev));
        start = nl + 1;
    }

    if (start == 0 && buf.size() == MAX_READ) {
        // A single unterminated line longer than one read; skip it
        log_warn("tailer", "Skipping " + std::to_string(buf.size()) +
                           " bytes without a line break at offset " + std::to_string(offset_));
        start = buf.size();
    }
    offset_ += start;
    if (start > 0) capture_marker();
    return events;
}

} // namespace rconbridge
