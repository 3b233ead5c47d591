/// \file game_loop_example.cpp
/// \brief Walkthrough of logx in a small simulated game.
///
/// Shows:
///   - one logger per subsystem channel with its own prefix and color
///   - channel configuration loaded from text (or a file given as argv[1])
///   - nested contexts with RAII scopes
///   - per-frame throttled metrics
///   - fluent assertions and validators
///   - lazy conditional logging
///   - exporting the session history

#include <logx/logx.hpp>

#include <cstdio>
#include <format>
#include <string>

namespace {

constexpr const char* kDefaultSettings =
    "rate_limiting = on\n"
    "default_rate_limit = 0.25\n"
    "channel.Performance = EditorOnly on\n"
    "channel.Physics = Both off\n";

/// Fans records out to the console and to the history buffer.
class TeeSink final : public logx::Sink {
public:
    TeeSink(logx::Sink& a, logx::Sink& b) : a_(a), b_(b) {}
    void write(const logx::Record& record) override {
        a_.write(record);
        b_.write(record);
    }

private:
    logx::Sink& a_;
    logx::Sink& b_;
};

logx::Result<logx::Settings> load(int argc, char** argv) {
    if (argc > 1)
        return logx::load_settings(argv[1]);
    return logx::parse_settings(kDefaultSettings);
}

} // namespace

int main(int argc, char** argv) {
    auto settings = load(argc, argv);
    if (!settings) {
        std::fprintf(stderr, "settings: %s [%s]\n", settings.error().message.c_str(),
                     settings.error().context.c_str());
        return 1;
    }

    logx::ConsoleSink console;
    logx::LogBuffer history;
    TeeSink tee(console, history);
    logx::ManualClock clock;

    logx::Runtime runtime(tee, clock, {.environment = logx::Environment::Editor});
    runtime.channels().bind(&*settings);

    logx::Logger gameplay(runtime, {.prefix = "Gameplay", .color = logx::colors::Cyan,
                                    .channel = logx::Channel::Gameplay});
    logx::Logger physics(runtime, {.prefix = "Physics", .channel = logx::Channel::Physics});
    logx::Logger perf(runtime, {.prefix = "Perf", .color = logx::colors::Green,
                                .channel = logx::Channel::Performance});

    double health = 100.0;
    int enemy_count = 140;

    gameplay.emit("Game started!");
    physics.emit("Physics channel is off, this never prints");

    {
        auto loading = runtime.scope("Level Loading");
        gameplay.emit("Loading assets");
        {
            auto spawner = runtime.scope("Enemy Spawner");
            gameplay.emit(std::format("Spawned {} enemies", enemy_count));
        }
        gameplay.emit("Level load complete");
    }

    gameplay.assert_that(enemy_count <= 100, "Too many enemies!")
        .on_failure([&] { enemy_count = 100; });
    gameplay.validate_range(health, 0, 100, "health");

    for (int frame = 0; frame < 180; ++frame) {
        clock.set(frame / 60.0);
        perf.log_throttled(std::format("FPS: {:.1f}", 60.0), 1.0);
    }

    {
        auto combat = runtime.scope("Combat");
        health -= 85.0;
        gameplay.emit(std::format("Player took 85 damage. Health: {}", health), logx::Level::Warning);
        gameplay.log_if(health <= 20, "CRITICAL HEALTH!", logx::Level::Error);
        gameplay.log_if([&] { return health < 50; },
                        [&] { return std::format("Debug info - health {}, enemies {}", health, enemy_count); });
    }

    if (auto st = history.export_to("logx_session.txt"); !st) {
        std::fprintf(stderr, "export: %s [%s]\n", st.error().message.c_str(),
                     st.error().context.c_str());
        return 1;
    }
    std::printf("%zu records exported to logx_session.txt\n", history.size());
    return 0;
}
