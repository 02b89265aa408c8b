#include "specstack/model/ModelCollection.hh"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>

namespace specstack {

namespace {

// Revisions are unique across all collections, so a copy shares its
// revision only with the collection it was copied from.
std::uint64_t next_revision() {
  static std::atomic<std::uint64_t> counter{0};
  return ++counter;
}

} // namespace

ModelHandle ModelCollection::Add(std::shared_ptr<SourceModel> model) {
  if (!model) throw std::invalid_argument("ModelCollection::Add: null model");
  const ModelHandle h = next_handle_++;
  entries_.emplace_back(h, std::move(model));
  revision_ = next_revision();
  return h;
}

bool ModelCollection::Remove(ModelHandle h) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [h](const auto& e) { return e.first == h; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  revision_ = next_revision();
  return true;
}

void ModelCollection::Clear() {
  if (entries_.empty()) return;
  entries_.clear();
  revision_ = next_revision();
}

bool ModelCollection::Contains(ModelHandle h) const noexcept {
  return std::any_of(entries_.begin(), entries_.end(),
                     [h](const auto& e) { return e.first == h; });
}

std::shared_ptr<SourceModel> ModelCollection::Shared(ModelHandle h) const {
  for (const auto& e : entries_) if (e.first == h) return e.second;
  throw std::out_of_range("ModelCollection: unknown model handle " + std::to_string(h));
}

SourceModel& ModelCollection::Get(ModelHandle h) { return *Shared(h); }
const SourceModel& ModelCollection::Get(ModelHandle h) const { return *Shared(h); }

std::vector<ModelHandle> ModelCollection::handles() const {
  std::vector<ModelHandle> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.first);
  return out;
}

std::size_t ModelCollection::NParameters() const {
  std::size_t n = 0;
  for (const auto& e : entries_) n += e.second->spectral().NParameters();
  return n;
}

std::size_t ModelCollection::NFreeParameters() const {
  std::size_t n = 0;
  for (const auto& e : entries_) n += e.second->spectral().NFreeParameters();
  return n;
}

} // namespace specstack
