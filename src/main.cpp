#include "fixedstep.hpp"
#include "logger.hpp"
#include "match.hpp"
#include "options.hpp"
#include "profiler.hpp"
#include <iostream>
#include <memory>
#include <random>

// Stand-in for a human at the keyboard: holds up/down to chase the ball while
// it approaches, drifts back to the middle otherwise.
static void drivePlayer(Match& match) {
    const MatchState& s = match.state();
    const double paddleMid = s.playerPaddle.centerY();
    const double target = s.ball.velocity.x < 0.0
                        ? s.ball.body.centerY()
                        : match.config().arenaHeight / 2.0;
    const double slack = match.config().paddleHeight / 5.0;
    match.moveUp(paddleMid > target + slack);
    match.moveDown(paddleMid < target - slack);
}

int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parseOptions(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "paddlesim: " << e.what() << "\n\n" << usageText();
        return 2;
    }
    if (opts.showHelp) {
        std::cout << usageText();
        return 0;
    }

    Logger logger(opts.logLevel);
    logger.addSink(std::make_shared<Logger::StdoutSink>());
    if (!opts.logFile.empty()) {
        auto file = std::make_shared<Logger::FileSink>(opts.logFile);
        if (!file->good()) {
            std::cerr << "paddlesim: cannot open log file '" << opts.logFile << "'\n";
            return 2;
        }
        logger.addSink(file);
    }

    const std::uint32_t seed = opts.seeded ? opts.seed : std::random_device{}();
    LOG_INFO(&logger, "Match arena={}x{} paddle={}x{} ball={} speed={} winScore={} seed={}",
             opts.match.arenaWidth, opts.match.arenaHeight,
             opts.match.paddleWidth, opts.match.paddleHeight, opts.match.ballSize,
             opts.match.baseBallSpeed, opts.match.winScore, seed);

    Profiler profiler;
    Match match(opts.match, std::make_shared<SeededRandom>(seed));
    match.setLogger(&logger);
    match.setProfiler(&profiler);

    FixedStep loop;
    loop.setLogger(&logger);
    loop.setProfiler(&profiler);
    loop.applySettings(opts.loop);

    auto input  = loop.addPhase("Input");
    auto sim    = loop.addPhase("Simulation");
    auto render = loop.addPhase("Render");

    int finished = 0;
    int playerWins = 0;

    loop.addSerialSubsystem(input, [&](std::int64_t, FixedStep::Seconds){
        switch (match.state().phase) {
            case Phase::Idle:
                match.start();
                break;
            case Phase::Active:
                drivePlayer(match);
                break;
            case Phase::Finished:
                if (finished < opts.matches) match.restart();
                else loop.requestExit();
                break;
        }
    });

    loop.addSerialSubsystem(sim, [&](std::int64_t, FixedStep::Seconds){
        const Phase before = match.state().phase;
        match.tick();
        if (before != Phase::Finished && match.state().phase == Phase::Finished) {
            ++finished;
            if (match.snapshot().winner == Side::Player) ++playerWins;
        }
    });

    loop.addSerialSubsystem(render, [&](std::int64_t f, FixedStep::Seconds){
        if (opts.snapshotEvery <= 0 || f % opts.snapshotEvery) return;
        const Snapshot snap = match.snapshot();
        LOG_INFO(&logger, "[SNAPSHOT] frame={} phase={} score={}-{} ball=({:.1f},{:.1f}) player.y={:.1f} ai.y={:.1f}",
                 f, phaseName(snap.phase), snap.playerScore, snap.aiScore,
                 snap.ball.x, snap.ball.y, snap.playerPaddle.y, snap.aiPaddle.y);
    });

    if (opts.realtime) loop.run();
    else               loop.runUnpaced();

    const Snapshot snap = match.snapshot();
    std::cout << "Final frame=" << loop.frame()
              << " matches=" << finished
              << " playerWins=" << playerWins
              << " score=" << snap.playerScore << "-" << snap.aiScore
              << " winner=" << sideName(snap.winner)
              << " droppedSteps=" << loop.droppedSteps()
              << "\n";
    profiler.dump(std::cout);
    return 0;
}
