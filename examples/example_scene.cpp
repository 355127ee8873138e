/**
 * example_scene.cpp - Building a frame with vellum and rendering it on the CPU
 *
 * Demonstrates:
 *   - A sine grating (repeating linear gradient) under a gaussian alpha mask
 *   - Solid shapes, strokes and a stretched image
 *   - A pre-rendered sub-scene stamped several times
 *   - Text layout when a TrueType font path is given
 *   - Writing the result to a raw PPM file for viewing
 *
 * Build:
 *   cmake -B build -DVELLUM_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/example_scene [font.ttf]
 *
 * Output: scene.ppm
 */

#include <vellum/vellum.hpp>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <vector>

using namespace vellum;

static constexpr f64 kPi = 3.14159265358979323846;

static void writePPM(const char* filename, const Pixmap& pm) {
    std::ofstream f(filename, std::ios::binary);
    f << "P6\n" << pm.width() << " " << pm.height() << "\n255\n";
    for (i32 y = 0; y < pm.height(); ++y) {
        for (i32 x = 0; x < pm.width(); ++x) {
            Pixel p = pm.pixel(x, y);
            f.put(char(p.r)); f.put(char(p.g)); f.put(char(p.b));
        }
    }
    std::printf("Written: %s (%dx%d)\n", filename, pm.width(), pm.height());
}

// One period of a sine wave sampled into equidistant stops.
static Gradient sineGrating(f64 period, f32 contrast) {
    std::vector<Color> colors;
    const int samples = 16;
    for (int i = 0; i <= samples; ++i) {
        f32 v = 0.5f + 0.5f * contrast * f32(std::sin(2 * kPi * i / samples));
        colors.push_back({v, v, v, 1});
    }
    return Gradient::MakeEquidistant(Extend::Repeat,
                                     GradientKind::MakeLinear({0, 0}, {period, 0}), colors);
}

// Opaque in the middle, fading out like a gaussian with the given sigma.
static Gradient gaussianEnvelope(f32 sigma) {
    std::vector<Color> colors;
    const int samples = 12;
    for (int i = 0; i <= samples; ++i) {
        f32 r = 3 * sigma * f32(i) / samples;
        f32 a = std::exp(-(r * r) / (2 * sigma * sigma));
        colors.push_back({1, 1, 1, a});
    }
    return Gradient::MakeEquidistant(Extend::Pad,
                                     GradientKind::MakeRadial({0, 0}, 0, {0, 0}, 3 * sigma),
                                     colors);
}

static std::shared_ptr<const Image> checkerboard(i32 size) {
    std::vector<u8> bytes;
    bytes.reserve(size_t(size) * size_t(size) * 4);
    for (i32 y = 0; y < size; ++y) {
        for (i32 x = 0; x < size; ++x) {
            u8 v = ((x + y) & 1) ? 230 : 40;
            bytes.insert(bytes.end(), {v, u8(v / 2), 80, 255});
        }
    }
    return Image::MakeFromBytes(std::move(bytes), size, size);
}

static PrerenderedScene makeBadge() {
    Scene badge({}, 40, 40, Scene::Origin::TopLeft);
    badge.draw(Geom<RoundedRectangle>(Style::MakeFill(), RoundedRectangle{{0, 0}, {40, 40}, 8},
                                      Brush::MakeSolid({0.9f, 0.5f, 0.1f, 1})));
    StrokeStyle outline;
    outline.width = 3;
    badge.draw(Geom<Circle>(Style::MakeStroke(outline), Circle{{20, 20}, 12},
                            Brush::MakeSolid({1, 1, 1, 1})));
    // Anchor the badge at its centre.
    return PrerenderedScene::FromScene(badge, Affine::Translate(-20, -20));
}

int main(int argc, char** argv) {
    const u32 W = 480;
    const u32 H = 320;
    Scene scene({0.5f, 0.5f, 0.5f, 1}, W, H);

    // Grating patch: content and mask share the same clip circle.
    Shape patch = Circle{{0, 0}, 120};
    scene.drawAlphaMask(
        [](Scene& s) {
            s.draw(Geom<Rectangle>(Style::MakeFill(), Rectangle::MakeCentered(0, 0, 240, 240),
                                   Brush::MakeGradient(sineGrating(30, 0.9f)),
                                   Affine::Rotate(kPi / 6)));
        },
        [](Scene& s) {
            s.draw(Geom<Rectangle>(Style::MakeFill(), Rectangle::MakeCentered(0, 0, 240, 240),
                                   Brush::MakeGradient(gaussianEnvelope(40))));
        },
        patch, Affine::Translate(-80, 0));

    // Fixation dot.
    scene.draw(Geom<Circle>(Style::MakeFill(), Circle{{0, 0}, 4}, Brush::MakeSolid({1, 0, 0, 1})));

    // Stretched image on the right.
    scene.draw(makeImageGeom(checkerboard(8), 150, -60, 120, 120, Affine(), ImageFit::Fill()));

    PrerenderedScene badge = makeBadge();
    const Affine anchor = badge.transform;
    for (int i = 0; i < 3; ++i) {
        badge.transform = Affine::Translate(110 + 50 * i, 90) * anchor;
        scene.draw(badge);
    }

#if VELLUM_HAS_TRUETYPE
    if (argc > 1) {
        FormattedText label;
        label.text = "vellum";
        label.size = 28;
        label.color = {1, 1, 1, 1};
        label.font = TrueTypeFont::MakeFromFile(argv[1]);
        label.alignment = Alignment::Center;
        label.verticalAlignment = VerticalAlignment::Bottom;
        label.y = -130;
        if (label.font) scene.draw(label);
    }
#else
    (void)argc;
    (void)argv;
#endif

    auto recording = scene.finish();
    std::printf("Recorded %zu ops, %zu image(s)\n",
                recording->ops().size(), recording->images().size());

    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(i32(W), i32(H)));
    CpuBackend backend(&pm);
    backend.beginFrame(scene.backgroundColor());
    backend.execute(*recording);
    backend.endFrame();

    const auto& stats = backend.stats();
    std::printf("fills=%u strokes=%u layers=%u glyphRuns=%u\n",
                stats.fills, stats.strokes, stats.layers, stats.glyphRuns);

    writePPM("scene.ppm", pm);
    return 0;
}
