#pragma once

#include <atomic>
#include <istream>
#include <string>
#include <thread>

#include "cryguard/score_types.hpp"
#include "cryguard/window_queue.hpp"

namespace cryguard {

// Parses one scored-window line:
//   window_id,timestamp,primary_decision,primary_score,baby_score,cat_score[,other_suppress_score]
// Empty fields are reported as missing (NaN for primary_score). Empty
// window_id/timestamp take next_id/now_sec. Throws ValidationError when the
// line has too few fields.
ScoreSet parse_score_line(const std::string& line, uint64_t next_id, double now_sec);

// Reads scored windows written by the inference collaborator and hands them
// to the monitor loop. Stops the queue when the source ends.
class ScoreFeed {
public:
    ScoreFeed(const std::string& source, WindowQueue<ScoreSet>& queue);
    ~ScoreFeed();

    void start();
    void stop();

private:
    void run();
    bool wait_readable(std::istream& in) const;

    std::string source_;
    WindowQueue<ScoreSet>& queue_;
    std::thread worker_;
    std::atomic<bool> running_{false};
};

}  // namespace cryguard
