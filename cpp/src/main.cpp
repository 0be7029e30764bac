#include "sightline/cli.hpp"
#include "sightline/config.hpp"
#include "sightline/field.hpp"
#include "sightline/rng.hpp"
#include "sightline/visibility.hpp"

#include <cmath>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef SIGHTLINE_WITH_RAYLIB
#include <raylib.h>
#endif

namespace {

constexpr double kTwoPi = 6.28318530717958647692;
constexpr double kSweepOrbit = 300.0;

struct SweepSummary {
    int frames = 0;
    int visible = 0;
    int blocked = 0;
    int hits = 0;
};

// Orbits the source around the target and counts visibility outcomes per frame.
SweepSummary run_sweep(const sl::Circle& target, double source_radius, const std::vector<sl::Circle>& obstacles,
                       int frames, const sl::VisibilityOptions& options) {
    SweepSummary summary{};
    for (int i = 0; i < frames; ++i) {
        const double theta = (static_cast<double>(i) / static_cast<double>(frames)) * kTwoPi;
        const sl::Circle source{
            {target.center.x + std::cos(theta) * kSweepOrbit, target.center.y + std::sin(theta) * kSweepOrbit},
            source_radius,
        };

        for (const auto& tv : sl::visible_tangents(target, source, obstacles, options)) {
            if (tv.hit.has_value()) summary.hits += 1;
        }
        if (sl::is_visible(target, source, obstacles, options)) {
            summary.visible += 1;
        } else {
            summary.blocked += 1;
        }
        summary.frames += 1;
    }
    return summary;
}

void print_usage() {
    std::cout << "Usage: sightline [--headless|--rendered] [--seed N] [--obstacles N] [--frames N]\n"
                 "                 [--source X,Y,R] [--target X,Y,R] [--unbounded] [--rank-x]\n";
}

} // namespace

int main(int argc, char** argv) {
#ifdef SIGHTLINE_WITH_RAYLIB
    bool headless = false;
#endif
    std::uint64_t seed = sl::kDefaultSeed;
    int obstacle_count = sl::kDefaultObstacleCount;
    int frames = sl::kDefaultSweepFrames;
    sl::Circle target{{sl::kTargetX, sl::kTargetY}, sl::kTargetRadius};
    std::optional<sl::Circle> fixed_source;
    sl::VisibilityOptions options{};

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
#ifndef SIGHTLINE_WITH_RAYLIB
            if (arg == "--rendered") {
                std::cerr << "Rendered mode is unavailable: built without raylib.\n";
                return 2;
            }
#endif
            if (arg == "--headless") {
#ifdef SIGHTLINE_WITH_RAYLIB
                headless = true;
#endif
            } else if (arg == "--rendered") {
#ifdef SIGHTLINE_WITH_RAYLIB
                headless = false;
#endif
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = sl::parse_u64(argv[++i]);
            } else if (arg == "--obstacles" && i + 1 < argc) {
                obstacle_count = sl::parse_int(argv[++i]);
            } else if (arg == "--frames" && i + 1 < argc) {
                frames = sl::parse_int(argv[++i]);
            } else if ((arg == "--source" || arg == "--target") && i + 1 < argc) {
                const auto parsed = sl::parse_circle(argv[++i]);
                if (!parsed.has_value()) {
                    std::cerr << "Invalid " << arg << " circle. Expected X,Y,R with R >= 0\n";
                    return 2;
                }
                if (arg == "--source") {
                    fixed_source = parsed;
                } else {
                    target = *parsed;
                }
            } else if (arg == "--unbounded") {
                options.extent = sl::OcclusionExtent::Ray;
            } else if (arg == "--rank-x") {
                options.ranking = sl::HitRanking::AxisX;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << '\n';
                print_usage();
                return 2;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse CLI arguments: " << ex.what() << '\n';
        return 2;
    }

    if (frames < 1) {
        std::cerr << "--frames must be >= 1\n";
        return 2;
    }
    if (obstacle_count < 0) {
        std::cerr << "--obstacles must be >= 0\n";
        return 2;
    }

    sl::DeterministicRng rng(seed);
    std::vector<sl::Circle> obstacles;
    try {
        obstacles = sl::generate_obstacles(rng, {obstacle_count, static_cast<double>(sl::kWindowWidth),
                                                 static_cast<double>(sl::kWindowHeight), sl::kObstacleMinRadius,
                                                 sl::kObstacleMaxRadius});
    } catch (const std::exception& ex) {
        std::cerr << "Failed to generate obstacles: " << ex.what() << '\n';
        return 2;
    }

#ifdef SIGHTLINE_WITH_RAYLIB
    if (!headless) {
        if (fixed_source.has_value()) {
            std::cerr << "--source is ignored in rendered mode: the source follows the mouse.\n";
        }
        InitWindow(sl::kWindowWidth, sl::kWindowHeight, "Sightline");
        SetTargetFPS(sl::kTargetFps);

        double source_radius = sl::kSourceDefaultRadius;

        while (!WindowShouldClose()) {
            const float wheel = GetMouseWheelMove();
            if (wheel > 0.0f && source_radius < sl::kSourceMaxRadius) source_radius += sl::kSourceRadiusStep;
            if (wheel < 0.0f && source_radius > sl::kSourceMinRadius) source_radius -= sl::kSourceRadiusStep;

            const Vector2 mouse = GetMousePosition();
            const sl::Circle source{{mouse.x, mouse.y}, source_radius};

            BeginDrawing();
            ClearBackground({30, 30, 30, 255});

            DrawCircleLines(static_cast<int>(target.center.x), static_cast<int>(target.center.y),
                            static_cast<float>(target.r), RED);
            DrawCircleLines(static_cast<int>(mouse.x), static_cast<int>(mouse.y), static_cast<float>(source.r), GREEN);

            const auto corridor = sl::tangent_corridor(source, target);
            if (corridor.has_value()) {
                const auto& q = *corridor;
                for (std::size_t k = 0; k < q.size(); ++k) {
                    const auto& a = q[k];
                    const auto& b = q[(k + 1) % q.size()];
                    DrawLineV({static_cast<float>(a.x), static_cast<float>(a.y)},
                              {static_cast<float>(b.x), static_cast<float>(b.y)}, WHITE);
                }
            }

            for (const auto& o : obstacles) {
                const bool in_corridor = corridor.has_value() && sl::circle_overlaps_quad(*corridor, o);
                DrawCircleLines(static_cast<int>(o.center.x), static_cast<int>(o.center.y), static_cast<float>(o.r),
                                in_corridor ? MAGENTA : SKYBLUE);
            }

            try {
                for (const auto& tv : sl::visible_tangents(target, source, obstacles, options)) {
                    DrawLineV({static_cast<float>(tv.tangent.p0.x), static_cast<float>(tv.tangent.p0.y)},
                              {static_cast<float>(tv.tangent.p1.x), static_cast<float>(tv.tangent.p1.y)}, WHITE);
                    if (tv.hit.has_value()) {
                        DrawCircleV({static_cast<float>(tv.hit->point.x), static_cast<float>(tv.hit->point.y)}, 5.0f,
                                    YELLOW);
                    }
                }
                const bool visible = sl::is_visible(target, source, obstacles, options);
                DrawText(visible ? "VISIBLE" : "BLOCKED", 16, 16, 20, visible ? GREEN : RED);
            } catch (const sl::InvalidGeometry& ex) {
                std::cerr << "Skipping frame: " << ex.what() << '\n';
            }

            DrawText(TextFormat("r=%.0f  obstacles=%d", source_radius, static_cast<int>(obstacles.size())), 16,
                     40, 18, LIGHTGRAY);
            EndDrawing();
        }

        CloseWindow();
        return 0;
    }
#endif

    try {
        if (fixed_source.has_value()) {
            const bool visible = sl::is_visible(target, *fixed_source, obstacles, options);
            std::cout << "seed=" << seed << " obstacles=" << obstacles.size() << " visible=" << (visible ? 1 : 0)
                      << '\n';
            return 0;
        }

        const auto summary = run_sweep(target, sl::kSourceDefaultRadius, obstacles, frames, options);
        std::cout << "seed=" << seed << " frames=" << summary.frames << " visible=" << summary.visible
                  << " blocked=" << summary.blocked << " hits=" << summary.hits << '\n';
    } catch (const sl::InvalidGeometry& ex) {
        std::cerr << "Geometry error: " << ex.what() << '\n';
        return 2;
    }
    return 0;
}
