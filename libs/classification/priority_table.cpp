/**
 * @file priority_table.cpp
 * @brief Central criterion priority table and engine enum names
 */

#include "hexarch/classification/engine.hpp"

#include <algorithm>
#include <array>

namespace hexarch::classification {

namespace {

struct PriorityEntry
{
    std::string_view id;
    int priority;
};

// Sorted by id.
constexpr std::array<PriorityEntry, 29> kPriorityTable = {{
    {"domain.contained-entity", 70},
    {"domain.domain-enum", 65},
    {"domain.domain-event-naming", 68},
    {"domain.domain-record-value-object", 65},
    {"domain.domain-service-naming", 55},
    {"domain.embedded-value-object", 70},
    {"domain.explicit-aggregate-root", 100},
    {"domain.explicit-domain-event", 100},
    {"domain.explicit-entity", 100},
    {"domain.explicit-identifier", 100},
    {"domain.explicit-value-object", 100},
    {"domain.flexible-application-service", 60},
    {"domain.inherited-aggregate-root", 75},
    {"domain.inherited-entity", 75},
    {"domain.inherited-value-object", 75},
    {"domain.record-single-id", 80},
    {"domain.repository-dominant", 80},
    {"port.command-pattern", 75},
    {"port.explicit-primary-port", 100},
    {"port.explicit-repository", 100},
    {"port.explicit-secondary-port", 100},
    {"port.injected-as-dependency", 75},
    {"port.naming-gateway", 80},
    {"port.naming-repository", 80},
    {"port.naming-use-case", 80},
    {"port.package-in", 60},
    {"port.package-out", 60},
    {"port.query-pattern", 75},
    {"port.signature-based-driven-port", 70},
}};

}  // namespace

int default_priority(std::string_view criterion_id)
{
    auto it = std::ranges::lower_bound(kPriorityTable, criterion_id, {}, &PriorityEntry::id);
    if (it == kPriorityTable.end() || it->id != criterion_id) {
        return 0;
    }
    return it->priority;
}

std::vector<std::string> known_criterion_ids()
{
    std::vector<std::string> ids;
    ids.reserve(kPriorityTable.size());
    for (const auto& entry : kPriorityTable) {
        ids.emplace_back(entry.id);
    }
    return ids;
}

std::string_view to_string(ConfidenceLevel level)
{
    switch (level) {
        case ConfidenceLevel::kLow:
            return "LOW";
        case ConfidenceLevel::kMedium:
            return "MEDIUM";
        case ConfidenceLevel::kHigh:
            return "HIGH";
        case ConfidenceLevel::kExplicit:
            return "EXPLICIT";
    }
    return "LOW";
}

std::string_view to_string(EvidenceKind kind)
{
    switch (kind) {
        case EvidenceKind::kNaming:
            return "NAMING";
        case EvidenceKind::kStructural:
            return "STRUCTURE";
        case EvidenceKind::kRelationship:
            return "RELATIONSHIP";
        case EvidenceKind::kAnnotation:
            return "ANNOTATION";
    }
    return "STRUCTURE";
}

std::string_view to_string(ConflictSeverity severity)
{
    return severity == ConflictSeverity::kError ? "ERROR" : "WARNING";
}

std::string_view to_string(ClassificationStatus status)
{
    switch (status) {
        case ClassificationStatus::kClassified:
            return "CLASSIFIED";
        case ClassificationStatus::kUnclassified:
            return "UNCLASSIFIED";
        case ClassificationStatus::kConflict:
            return "CONFLICT";
    }
    return "UNCLASSIFIED";
}

}  // namespace hexarch::classification
