#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../loadout/build/BuildEngine.h"
#include "../loadout/build/BuildValidator.h"
#include "../loadout/config/BuildRequest.h"
#include "../loadout/config/ClassTable.h"
#include "../loadout/items/CatalogLoader.h"

namespace {

void printUsage() {
    std::cerr << "usage: loadout_forge [--verbose] <catalog.json> [request.json] [class_base.json]\n";
}

std::string formatFixed(float v, int decimals = 1) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, static_cast<double>(v));
    return buf;
}

void printBuild(std::size_t rank, const Loadout::ScoredBuild& sb, int playerLevel) {
    using namespace Loadout;
    const auto& d = sb.derived;
    std::cout << "#" << rank << "  score " << formatFixed(sb.score, 2) << "\n";
    for (std::size_t s = 0; s < kSlotCount; ++s) {
        const auto slot = static_cast<EquipmentSlot>(s);
        if (slot == EquipmentSlot::Ring) {
            for (const Item* r : sb.build.rings) {
                if (r) std::cout << "    ring        " << r->name << " (" << tierName(r->tier) << ", lvl " << r->level << ")\n";
            }
            continue;
        }
        const Item* it = sb.build.item(slot);
        if (!it) continue;
        std::string label = slotName(slot);
        label.resize(12, ' ');
        std::cout << "    " << label << it->name << " (" << tierName(it->tier) << ", lvl " << it->level;
        if (it->weapon.has_value()) std::cout << ", " << attackSpeedName(it->weapon->attackSpeed);
        std::cout << ")\n";
    }
    std::cout << "    dps " << formatFixed(d.dps) << " (melee " << formatFixed(d.damage.meleeDps) << ", poison "
              << formatFixed(d.damage.poisonDps) << ")  mana/s " << formatFixed(d.manaSustain, 2) << "  ehp "
              << formatFixed(d.ehp.combinedEhp, 0) << " (hp " << formatFixed(d.ehp.totalHp, 0) << ")\n";
    std::cout << "    skill points " << d.skillPointTotal << " (";
    for (std::size_t k = 0; k < kSkillCount; ++k) {
        const auto stat = static_cast<SkillStat>(k);
        std::cout << (k ? " " : "") << skillName(stat) << " " << d.skillPoints.get(stat);
    }
    std::cout << ")  cost " << formatFixed(d.cost, 0) << "  spells";
    for (const auto& sc : d.spellCosts) std::cout << " " << sc.name << "=" << sc.cost;
    std::cout << "\n";

    const BuildReport report = validateBuild(sb.build, playerLevel);
    for (const auto& e : report.errors) std::cout << "    ! " << e << "\n";
    for (const auto& w : report.warnings) std::cout << "    ~ " << w << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--verbose" || a == "-v") {
            Forge::Logger::setMinLevel(Forge::LogLevel::Debug);
        } else if (a == "--help" || a == "-h") {
            printUsage();
            return 0;
        } else {
            args.push_back(a);
        }
    }
    if (args.empty() || args.size() > 3) {
        printUsage();
        return 2;
    }

    Loadout::IngestReport ingest{};
    auto catalog = Loadout::loadCatalog(args[0], ingest);
    if (!catalog.has_value()) return 1;

    const Loadout::CatalogSummary summary = Loadout::summarizeCatalog(*catalog);
    std::string bySlot;
    for (std::size_t s = 0; s < Loadout::kSlotCount; ++s) {
        bySlot += std::string(bySlot.empty() ? "" : ", ") + Loadout::slotName(static_cast<Loadout::EquipmentSlot>(s)) +
                  "=" + std::to_string(summary.bySlot[s]);
    }
    Forge::logInfo("Catalog: " + std::to_string(summary.total) + " items, levels " + std::to_string(summary.minLevel) +
                   ".." + std::to_string(summary.maxLevel) + " (" + bySlot + ")");

    Loadout::BuildRequest request{};
    if (args.size() >= 2) {
        auto loaded = Loadout::loadBuildRequest(args[1]);
        if (!loaded.has_value()) return 1;
        request = *loaded;
    }
    const Loadout::ClassTable classes =
        args.size() >= 3 ? Loadout::loadClassTable(args[2]) : Loadout::loadClassTable("data/class_base.json");

    if (!request.elements.empty()) {
        std::string elements;
        for (auto el : request.elements) elements += std::string(elements.empty() ? "" : ", ") + Loadout::elementName(el);
        Forge::logInfo("Element preference: " + elements + (request.strictElements ? " (strict)" : ""));
    }

    const auto result = Loadout::generateBuilds(*catalog, request, classes);
    if (!result.diagnostic.empty()) {
        std::cout << "No builds: " << result.diagnostic << "\n";
        return 1;
    }
    if (result.builds.empty()) {
        std::cout << "No valid builds found (" << result.combinationsChecked << " combinations checked).\n";
        return 0;
    }

    for (std::size_t i = 0; i < result.builds.size(); ++i) {
        printBuild(i + 1, result.builds[i], request.playerLevel);
    }
    if (result.truncated) {
        std::cout << "Search stopped early (" << Loadout::stopReasonName(result.stopReason)
                  << "); better builds may exist.\n";
    }
    return 0;
}
