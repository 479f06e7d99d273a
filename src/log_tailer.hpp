#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "model.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rconbridge {

// File position that survives restarts: which file (device + inode) and how
// far into it complete lines have been emitted. The marker is a hash of the
// bytes just before the offset, so a file rewritten in place to at least the
// same size is still noticed.
struct TailCheckpoint {
    uint64_t dev = 0;
    uint64_t ino = 0;
    uint64_t offset = 0;
    uint64_t marker_len = 0;
    uint64_t marker_hash = 0;
};

std::optional<TailCheckpoint> load_tail_checkpoint(const std::string& path);
bool save_tail_checkpoint(const std::string& path, const TailCheckpoint& checkpoint);

// Incremental reader of one growing log file.
//
// Seeking:   the file is not open yet (startup, or it went missing). On the
//            next poll that finds it, the position is taken from the
//            checkpoint when it names the same file, from the end of file at
//            startup without one (start_at_end), or from 0 otherwise.
// Following: each poll reads from the offset to the current end and emits
//            complete lines only. A different (dev, ino), a size below the
//            offset, or bytes before the offset that no longer match the
//            marker is a rotation: the offset restarts at 0 and the rotation
//            counter goes up. Lines appended to the old file between the last
//            poll and the rotation are not seen.
class LogTailer {
public:
    enum class State { Seeking, Following };

    LogTailer(std::string path, std::string checkpoint_path, bool start_at_end,
              EventBus* bus = nullptr);

    // Called from a single thread.
    std::vector<LogEvent> poll();

    // Persist the current position (also done after every non-empty poll).
    bool save_checkpoint() const;

    State state() const { return state_; }
    uint64_t offset() const { return offset_; }
    uint64_t rotations() const { return rotations_.load(); }
    uint64_t missing_count() const { return missing_.load(); }

    static constexpr size_t MAX_READ = 1 << 20;
    static constexpr size_t MARKER_BYTES = 64;

private:
    void rotate(const char* reason);
    std::vector<LogEvent> read_new_lines(uint64_t file_size);
    void capture_marker();
    bool marker_matches() const;

    std::string path_;
    std::string checkpoint_path_;
    bool start_at_end_;
    EventBus* bus_;

    State state_ = State::Seeking;
    std::optional<TailCheckpoint> known_;  // position to resume in Seeking
    bool first_poll_ = true;
    bool missing_reported_ = false;

    uint64_t dev_ = 0;
    uint64_t ino_ = 0;
    uint64_t offset_ = 0;
    uint64_t marker_len_ = 0;
    uint64_t marker_hash_ = 0;

    std::atomic<uint64_t> rotations_{0};
    std::atomic<uint64_t> missing_{0};
};

} // namespace rconbridge
