#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "specstack/model/SourceModel.hh"

namespace specstack {

using ModelHandle = std::size_t;

/**
 * Ordered set of source models attached to a dataset.
 *
 * Each added model receives a handle that stays valid until the model is
 * removed and is never reused. revision() changes on every mutation of the
 * set, which is what per-model caches key their invalidation on.
 */
class ModelCollection {
public:
  ModelHandle Add(std::shared_ptr<SourceModel> model);
  bool Remove(ModelHandle h);
  void Clear();

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  bool Contains(ModelHandle h) const noexcept;

  SourceModel& Get(ModelHandle h);
  const SourceModel& Get(ModelHandle h) const;
  std::shared_ptr<SourceModel> Shared(ModelHandle h) const;

  std::vector<ModelHandle> handles() const;
  std::uint64_t revision() const noexcept { return revision_; }

  std::size_t NParameters() const;
  std::size_t NFreeParameters() const;

private:
  std::vector<std::pair<ModelHandle, std::shared_ptr<SourceModel>>> entries_;
  ModelHandle   next_handle_ = 0;
  std::uint64_t revision_    = 0;
};

} // namespace specstack
