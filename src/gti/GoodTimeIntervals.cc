#include "specstack/gti/GoodTimeIntervals.hh"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace specstack {

GoodTimeIntervals::GoodTimeIntervals(std::string reference_time)
: reference_time_(std::move(reference_time)) {}

GoodTimeIntervals::GoodTimeIntervals(std::vector<TimeInterval> intervals, std::string reference_time)
: reference_time_(std::move(reference_time))
{
  for (const auto& iv : intervals) Add(iv.start_s, iv.stop_s);
}

void GoodTimeIntervals::Add(double start_s, double stop_s) {
  if (stop_s < start_s) throw std::invalid_argument("GoodTimeIntervals: stop before start");
  intervals_.push_back({start_s, stop_s});
}

double GoodTimeIntervals::TimeSum() const {
  double s = 0.0;
  for (const auto& iv : intervals_) s += iv.stop_s - iv.start_s;
  return s;
}

double GoodTimeIntervals::TimeStart() const {
  if (intervals_.empty()) throw std::runtime_error("GoodTimeIntervals: no intervals");
  return std::min_element(intervals_.begin(), intervals_.end(),
                          [](const TimeInterval& a, const TimeInterval& b) { return a.start_s < b.start_s; })->start_s;
}

double GoodTimeIntervals::TimeStop() const {
  if (intervals_.empty()) throw std::runtime_error("GoodTimeIntervals: no intervals");
  return std::max_element(intervals_.begin(), intervals_.end(),
                          [](const TimeInterval& a, const TimeInterval& b) { return a.stop_s < b.stop_s; })->stop_s;
}

void GoodTimeIntervals::Stack(const GoodTimeIntervals& other) {
  intervals_.insert(intervals_.end(), other.intervals_.begin(), other.intervals_.end());
}

GoodTimeIntervals GoodTimeIntervals::Union() const {
  std::vector<TimeInterval> sorted = intervals_;
  std::sort(sorted.begin(), sorted.end(),
            [](const TimeInterval& a, const TimeInterval& b) { return a.start_s < b.start_s; });

  GoodTimeIntervals out(reference_time_);
  for (const auto& iv : sorted) {
    if (!out.intervals_.empty() && iv.start_s <= out.intervals_.back().stop_s) {
      out.intervals_.back().stop_s = std::max(out.intervals_.back().stop_s, iv.stop_s);
    } else {
      out.intervals_.push_back(iv);
    }
  }
  return out;
}

} // namespace specstack
