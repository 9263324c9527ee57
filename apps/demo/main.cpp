// --- TICKSYNC LOOPBACK DEMO --- //
// File: main.cpp
// Description: One authoritative server and two clients in a single process,
//              linked by a simulated network with latency and loss.
//              Usage: tks_demo [seconds] [latency_ms] [loss_percent]
//              TKS_LOG_LEVEL=debug|info|warn|error selects the log threshold.
// Auteur: MasterLaplace

#include <tks/sync/SyncWorld.hpp>
#include <tks/net/transport/LoopbackTransport.hpp>
#include <tks/engine/GameLoop.hpp>
#include <tks/core/Log.hpp>

#include <array>
#include <cmath>
#include <cstdlib>
#include <format>
#include <memory>
#include <string_view>

using namespace tks;

namespace {

constexpr core::u32 kBallKey       = 1;
constexpr core::u32 kAvatarKeyBase = 100;
constexpr core::f32 kAvatarSpeed   = 4.0f;
constexpr core::f64 kFrameTime     = 1.0 / 50.0;

// ─── Scene ────────────────────────────────────────────────────

/// Game-side fields of one process; SyncWorld reads and writes them through bindings.
struct Scene
{
    math::Vec3f ball;
    core::i32   bounces{0};
    std::array<math::Vec3f, 2> avatars{};
    std::array<core::f32, 2>   aims{};
};

class SweepInput final : public input::IInputSource
{
public:
    explicit SweepInput(core::f64 phase) : _phase{phase} {}

    void setTime(core::f64 now) noexcept { _now = now; }

    core::f32 actionStrength(std::string_view action) const override
    {
        return action == "move_x" ? static_cast<core::f32>(std::sin(_now + _phase)) : 0.0f;
    }

    const char* name() const noexcept override { return "sweep"; }

private:
    core::f64 _phase;
    core::f64 _now{0.0};
};

input::ActionTable makeActions()
{
    input::ActionTable table;
    table.add("move_x", input::ActionKind::Analog);
    return table;
}

void spawnScene(sync::SyncWorld &world, Scene &scene, const std::array<core::PeerId, 2> &players)
{
    const core::usize history = world.config().historyCapacity();

    sync::SyncedEntity::Builder ball{"ball"};
    const auto position = ball.add<math::Vec3f>("position");
    const auto bounces = ball.add<core::i32>("bounces", {.strategy = sync::SyncStrategy::Reliable});
    auto ballEntity = ball.key(kBallKey).lagCompensated(position).build(history);
    ballEntity->bindAutoSync<math::Vec3f>(position, [&scene] { return scene.ball; },
                                          [&scene](const math::Vec3f &v) { scene.ball = v; });
    ballEntity->bindAutoSync<core::i32>(bounces, [&scene] { return scene.bounces; },
                                        [&scene](const core::i32 &v) { scene.bounces = v; });
    (void)world.spawn(std::move(ballEntity));

    for (core::usize i = 0; i < players.size(); ++i)
    {
        sync::SyncedEntity::Builder avatar{std::format("avatar{}", i)};
        const auto pos = avatar.add<math::Vec3f>("position", {.predicted = true});
        const auto aim = avatar.add<core::f32>("aim", {.strategy = sync::SyncStrategy::ClientOwned});
        auto entity = avatar.key(kAvatarKeyBase + players[i]).belongsTo(players[i]).build(history);
        entity->bindAutoSync<math::Vec3f>(pos, [&scene, i] { return scene.avatars[i]; },
                                          [&scene, i](const math::Vec3f &v) { scene.avatars[i] = v; });
        entity->bindAutoSync<core::f32>(aim, [&scene, i] { return scene.aims[i]; },
                                        [&scene, i](const core::f32 &v) { scene.aims[i] = v; });
        (void)world.spawn(std::move(entity));
    }
}

// ─── Game logic ───────────────────────────────────────────────

void moveBall(Scene &scene, core::f64 now)
{
    const math::Vec3f next{static_cast<core::f32>(10.0 * std::cos(now)), 0.0f,
                           static_cast<core::f32>(10.0 * std::sin(now))};
    if ((next.z >= 0.0f) != (scene.ball.z >= 0.0f))
    {
        ++scene.bounces;
    }
    scene.ball = next;
}

void moveAvatar(math::Vec3f &avatar, core::f32 axis, core::f64 dt)
{
    avatar.x += axis * kAvatarSpeed * static_cast<core::f32>(dt);
}

struct Client
{
    std::unique_ptr<net::transport::LoopbackTransport> link;
    std::unique_ptr<sync::SyncWorld>                   world;
    std::unique_ptr<SweepInput>                        input;
    Scene                                              scene;
    core::usize                                        slot{0};
};

} // namespace

// ─── MAIN ─────────────────────────────────────────────────────

int main(int argc, char **argv)
{
    if (const char *level = std::getenv("TKS_LOG_LEVEL"))
    {
        const auto parsed = core::parseLogLevel(level);
        if (core::Log::failed("DEMO", parsed, core::LogLevel::kError))
        {
            return EXIT_FAILURE;
        }
        core::Log::setMinLevel(*parsed);
    }

    const core::f64 seconds   = argc > 1 ? std::atof(argv[1]) : 10.0;
    const core::f64 latencyMs = argc > 2 ? std::atof(argv[2]) : 60.0;
    const core::f32 lossPct   = argc > 3 ? static_cast<core::f32>(std::atof(argv[3])) : 5.0f;

    const auto baseConfig = [&](bool server) {
        return engine::Config::Builder{}
            .serverMode(server)
            .simulatedLatencyRange(latencyMs * 0.0005, latencyMs * 0.001)
            .simulatedPacketLossPercent(lossPct)
            .build();
    };
    const engine::Config serverConfig = baseConfig(true);
    const engine::Config clientConfig = baseConfig(false);

    if (auto valid = serverConfig.validate(); !valid)
    {
        core::Log::error("DEMO", valid.error().message());
        return EXIT_FAILURE;
    }

    net::transport::LoopbackNetwork network{net::transport::LoopbackConfig{
        .minLatency = serverConfig.simulatedMinLatency(),
        .maxLatency = serverConfig.simulatedMaxLatency(),
        .lossPercent = serverConfig.simulatedPacketLoss(),
        .seed = serverConfig.simulationSeed(),
    }};

    const input::ActionTable actions = makeActions();

    auto serverLink = network.createServer();
    sync::SyncWorld server{serverConfig, *serverLink, actions};
    Scene serverScene;

    std::array<Client, 2> clients;
    std::array<core::PeerId, 2> players{};
    for (core::usize i = 0; i < clients.size(); ++i)
    {
        clients[i].link = network.createClient();
        clients[i].slot = i;
        players[i] = clients[i].link->localPeerId();
    }

    spawnScene(server, serverScene, players);
    for (auto &c : clients)
    {
        c.world = std::make_unique<sync::SyncWorld>(clientConfig, *c.link, actions);
        c.input = std::make_unique<SweepInput>(static_cast<core::f64>(c.slot));
        c.world->setInputSource(c.input.get());
        spawnScene(*c.world, c.scene, players);
    }

    engine::GameLoop loop{serverConfig};
    engine::LoopCallbacks callbacks;

    callbacks.preFrame = [&](core::f64 now) { network.advance(now); };

    callbacks.fixedUpdate = [&](core::f64 dt, core::f64 now) {
        server.beginStep(now);
        moveBall(serverScene, now);
        for (core::usize i = 0; i < players.size(); ++i)
        {
            moveAvatar(serverScene.avatars[i], server.input(players[i]).action(0), dt);
        }
        server.endStep(now);

        for (auto &c : clients)
        {
            c.input->setTime(now);
            c.world->beginStep(now);
            moveAvatar(c.scene.avatars[c.slot], c.world->input(core::kLocalPeer).action(0), dt);
            c.scene.aims[c.slot] = static_cast<core::f32>(std::fmod(now, 6.283185307179586));
            c.world->endStep(now);
        }
    };

    callbacks.render = [&](core::f64 alpha) {
        server.render(alpha);
        for (auto &c : clients)
        {
            c.world->render(alpha);
        }
    };

    callbacks.postFrame = [&] {
        const core::u64 tick = loop.tickCount();
        if (tick == 0 || tick % 60 != 0)
        {
            return;
        }
        for (const auto &c : clients)
        {
            const core::usize other = 1 - c.slot;
            const math::Vec3f own = c.scene.avatars[c.slot];
            const math::Vec3f auth = serverScene.avatars[c.slot];
            core::Log::info("DEMO", std::format(
                "peer {} tick {} render {:.2f} rtt {:.1f} | own x {:.2f} (server {:.2f}) | "
                "peer x {:.2f} aim {:.2f} | ball ({:.2f}, {:.2f}) bounces {}",
                players[c.slot], c.world->clock().tick(), c.world->clock().renderTick(),
                c.world->roundTripTicks(), own.x, auth.x, c.scene.avatars[other].x,
                c.scene.aims[other], c.scene.ball.x, c.scene.ball.z, c.scene.bounces));
        }
        const auto stats = network.stats();
        core::Log::info("DEMO", std::format("server tick {} | sent {} delivered {} dropped {}",
                                            server.clock().tick(), stats.sent, stats.delivered, stats.dropped));
    };

    const auto frames = static_cast<core::u64>(seconds / kFrameTime);
    for (core::u64 f = 0; f < frames; ++f)
    {
        (void)loop.advance(kFrameTime, callbacks);
    }

    for (const auto &c : clients)
    {
        core::Log::info("DEMO", std::format("peer {} clock snaps: {}", players[c.slot], c.world->clock().snapCount()));
    }
    core::Log::info("DEMO", std::format("ran {} ticks, {:.3f}s of frame time dropped", loop.tickCount(), loop.droppedTime()));
    return EXIT_SUCCESS;
}
