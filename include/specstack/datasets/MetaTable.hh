#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace specstack {

/**
 * Per-observation metadata (one row per observation that went into a
 * dataset), stored column-wise. Cells are JSON values; a missing cell is null.
 */
class MetaTable {
public:
  MetaTable() = default;

  /// Single-row table from a flat JSON object.
  static MetaTable FromRow(const nlohmann::json& row);

  std::size_t nrows() const noexcept { return nrows_; }
  const std::vector<nlohmann::json>& column(const std::string& name) const;

  void AddRow(const nlohmann::json& row);

  /// Append the rows of other. Columns missing on either side are padded with null.
  void Join(const MetaTable& other);

private:
  std::map<std::string, std::vector<nlohmann::json>> columns_;
  std::size_t nrows_ = 0;
};

} // namespace specstack
