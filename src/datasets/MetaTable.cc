#include "specstack/datasets/MetaTable.hh"

#include <stdexcept>

namespace specstack {

using nlohmann::json;

MetaTable MetaTable::FromRow(const json& row) {
  MetaTable t;
  t.AddRow(row);
  return t;
}

const std::vector<json>& MetaTable::column(const std::string& name) const {
  auto it = columns_.find(name);
  if (it == columns_.end()) throw std::out_of_range("MetaTable: no column '" + name + "'");
  return it->second;
}

void MetaTable::AddRow(const json& row) {
  if (!row.is_object()) throw std::invalid_argument("MetaTable::AddRow: row must be a JSON object");

  for (auto it = row.begin(); it != row.end(); ++it) {
    auto& col = columns_[it.key()];
    col.resize(nrows_);   // new column: back-fill with null
    col.push_back(it.value());
  }
  ++nrows_;
  for (auto& kv : columns_) kv.second.resize(nrows_);
}

void MetaTable::Join(const MetaTable& other) {
  const std::size_t n_total = nrows_ + other.nrows_;
  for (const auto& kv : other.columns_) {
    auto& col = columns_[kv.first];
    col.resize(nrows_);
    col.insert(col.end(), kv.second.begin(), kv.second.end());
  }
  for (auto& kv : columns_) kv.second.resize(n_total);
  nrows_ = n_total;
}

} // namespace specstack
