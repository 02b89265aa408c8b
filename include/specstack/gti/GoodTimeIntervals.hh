#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace specstack {

struct TimeInterval {
  double start_s = 0.0;   // seconds since the reference time
  double stop_s  = 0.0;
};

/// Valid observation time intervals of a dataset.
class GoodTimeIntervals {
public:
  explicit GoodTimeIntervals(std::string reference_time = "2000-01-01");
  GoodTimeIntervals(std::vector<TimeInterval> intervals, std::string reference_time = "2000-01-01");

  const std::vector<TimeInterval>& intervals() const noexcept { return intervals_; }
  const std::string& reference_time() const noexcept { return reference_time_; }
  std::size_t size() const noexcept { return intervals_.size(); }
  bool empty() const noexcept { return intervals_.empty(); }

  void Add(double start_s, double stop_s);

  /// Sum of interval lengths [s]. Overlaps are counted twice; call Union first.
  double TimeSum() const;
  double TimeStart() const;
  double TimeStop() const;

  /// Append the intervals of other (no merging).
  void Stack(const GoodTimeIntervals& other);

  /// Sorted, with overlapping or touching intervals merged.
  GoodTimeIntervals Union() const;

private:
  std::vector<TimeInterval> intervals_;
  std::string reference_time_;
};

} // namespace specstack
