// Catalog ingestion: JSON item records -> typed Items plus a report of skipped records.
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Item.h"

namespace Loadout {

enum class IngestError {
    NotAnObject,
    MissingName,
    MissingSlot,
    UnknownSlot,
    InvalidLevel,
    InvalidField,
    Duplicate
};

struct IngestIssue {
    std::size_t index{0};  // position of the record in the source array
    std::string name;      // empty when the record had no usable name
    IngestError error{IngestError::InvalidField};
    std::string detail;
};

struct IngestReport {
    std::size_t recordsSeen{0};
    std::size_t accepted{0};
    std::vector<IngestIssue> issues;

    std::size_t skipped() const { return issues.size(); }
    bool clean() const { return issues.empty(); }
};

struct CatalogSummary {
    std::size_t total{0};
    std::array<std::size_t, kSlotCount> bySlot{};
    std::array<std::size_t, kTierCount> byTier{};
    int minLevel{0};
    int maxLevel{0};
};

const char* ingestErrorName(IngestError error);

// Parses catalog JSON text (a top-level array or an object with an "items" array).
// Returns nullopt only when the text is not JSON or has neither shape; bad records are
// skipped and listed in `report`.
std::optional<std::vector<Item>> ingestCatalogText(const std::string& text, IngestReport& report);

// File wrapper around ingestCatalogText; logs a one-line summary and the first few issues.
std::optional<std::vector<Item>> loadCatalog(const std::string& path, IngestReport& report);

CatalogSummary summarizeCatalog(const std::vector<Item>& items);

}  // namespace Loadout
