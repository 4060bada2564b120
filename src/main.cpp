// VoxelCore - Voxel world simulation core
// main.cpp - Headless driver: walks a viewpoint through the world and edits it

#include <voxelcore/core/config.hpp>
#include <voxelcore/core/logger.hpp>
#include <voxelcore/sim/simulation.hpp>
#include <voxelcore/world/block_catalog.hpp>

#include <array>
#include <cmath>
#include <filesystem>

namespace {

constexpr const char* VERSION = "0.1.0";

// Ticks the scripted observer walks along +x, one block per tick
constexpr int WALK_TICKS = 48;

// Observer height above the terrain surface
constexpr double EYE_HEIGHT = 3.0;

void report_exposed(const voxelcore::sim::Simulation& sim, const voxelcore::world::WorldPos& viewpoint) {
    using namespace voxelcore;

    auto exposed = sim.exposed_blocks_near(viewpoint);

    std::array<size_t, world::BLOCK_KIND_COUNT> per_kind{};
    for (const auto& block : exposed) {
        ++per_kind[static_cast<size_t>(block.kind)];
    }

    VOXELCORE_LOG_INFO(core::log_category::ENGINE, "Exposed blocks near ({:.1f}, {:.1f}, {:.1f}): {} of {} stored",
                       viewpoint.x, viewpoint.y, viewpoint.z, exposed.size(), sim.grid().size());
    for (const auto& desc : world::BlockCatalog::all()) {
        size_t count = per_kind[static_cast<size_t>(desc.kind)];
        if (count == 0) {
            continue;
        }
        VOXELCORE_LOG_DEBUG(core::log_category::ENGINE, "  {:<6} x{} rgb({:.2f}, {:.2f}, {:.2f})",
                            desc.display_name, count, desc.color.r, desc.color.g, desc.color.b);
    }
}

void log_interaction(const voxelcore::gameplay::InteractionResult& result) {
    using namespace voxelcore;

    if (result.target) {
        VOXELCORE_LOG_INFO(core::log_category::GAME, "Interaction {} at ({}, {}, {})",
                           gameplay::interaction_outcome_to_string(result.outcome), result.target->x,
                           result.target->y, result.target->z);
    } else {
        VOXELCORE_LOG_INFO(core::log_category::GAME, "Interaction {}",
                           gameplay::interaction_outcome_to_string(result.outcome));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace voxelcore;

    core::Config config;
    bool config_ok = true;
    if (argc > 1) {
        config_ok = config.load_or_create_default(std::filesystem::path(argv[1]));
    }

    core::LoggerConfig logger_config;
    auto level = core::parse_log_level(config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL));
    if (level) {
        logger_config.console_level = *level;
    }
    logger_config.enable_file = config.get_bool(core::config_section::DEBUG, core::config_key::LOG_TO_FILE, true);
    core::Logger::initialize(logger_config);

    VOXELCORE_LOG_INFO(core::log_category::ENGINE, "VoxelCore {}", VERSION);
    if (!config_ok) {
        VOXELCORE_LOG_WARN(core::log_category::CONFIG, "Using default settings");
    }
    if (!level) {
        VOXELCORE_LOG_WARN(core::log_category::CONFIG, "Unknown log level, using info");
    }

    sim::Simulation sim(sim::settings_from_config(config));
    sim.initialize();

    // Spawn above the center of chunk (0, 0)
    const auto& generator = sim.generator();
    world::WorldPos viewpoint(8.0, static_cast<double>(generator.get_height(8, 8)) + EYE_HEIGHT, 8.0);

    uint64_t rendered_revision = sim.grid().revision();
    report_exposed(sim, viewpoint);

    for (int tick = 0; tick < WALK_TICKS; ++tick) {
        viewpoint.x += 1.0;
        const auto block_x = static_cast<int32_t>(std::floor(viewpoint.x));
        const auto block_z = static_cast<int32_t>(std::floor(viewpoint.z));
        viewpoint.y = static_cast<double>(generator.get_height(block_x, block_z)) + EYE_HEIGHT;

        size_t generated = sim.update_viewpoint(viewpoint);
        if (generated > 0) {
            VOXELCORE_LOG_INFO(core::log_category::WORLD, "Tick {}: streamed {} chunks ({} loaded)", tick, generated,
                               sim.streamer().loaded_count());
        }

        // Mine the column under the observer every 8 ticks, then rebuild it with the next hotbar block
        if (tick % 8 == 7) {
            const glm::dvec3 down(0.0, -1.0, 0.0);
            log_interaction(sim.interact(viewpoint, down, gameplay::InteractionAction::Break));

            const int slot = (tick / 8) % world::HOTBAR_SLOT_COUNT + 1;
            if (!sim.select_hotbar_slot(slot)) {
                VOXELCORE_LOG_WARN(core::log_category::GAME, "Hotbar slot {} is empty", slot);
            }
            log_interaction(sim.interact(viewpoint, down, gameplay::InteractionAction::Place));
        }

        if (sim.grid().revision() != rendered_revision) {
            rendered_revision = sim.grid().revision();
            report_exposed(sim, viewpoint);
        }
    }

    // Looking at the sky finds nothing to break
    log_interaction(sim.interact(viewpoint, glm::dvec3(0.0, 1.0, 0.0), gameplay::InteractionAction::Break));

    VOXELCORE_LOG_INFO(core::log_category::ENGINE, "Done: {} chunks, {} blocks, revision {}",
                       sim.streamer().loaded_count(), sim.grid().size(), sim.grid().revision());

    core::Logger::shutdown();
    return 0;
}
