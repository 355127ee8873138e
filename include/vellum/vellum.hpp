#pragma once

/**
 * Vellum - backend-agnostic 2D scene builder
 *
 * Usage:
 *
 *   #include <vellum/vellum.hpp>
 *   vellum::Scene scene({1, 1, 1, 1}, 800, 600);
 *   scene.draw(vellum::Geom<vellum::Circle>(
 *       vellum::Style::MakeFill(vellum::FillRule::NonZero),
 *       vellum::Circle{{0, 0}, 50},
 *       vellum::Brush::MakeSolid({1, 0, 0, 1})));
 *   auto recording = scene.finish();
 *
 *   auto pixmap = vellum::Pixmap::Alloc(vellum::PixmapInfo::MakeRGBA(800, 600));
 *   vellum::CpuBackend backend(&pixmap);
 *   backend.beginFrame(scene.backgroundColor());
 *   backend.execute(*recording);
 *   backend.endFrame();
 *
 *   // TrueType fonts (requires #include <vellum/truetype_font.hpp>)
 *   auto font = vellum::TrueTypeFont::MakeFromFile("DejaVuSans.ttf");
 */

// Version
#include "vellum/version.hpp"

// Core types
#include "vellum/types.hpp"
#include "vellum/affine.hpp"
#include "vellum/shapes.hpp"
#include "vellum/style.hpp"
#include "vellum/brush.hpp"

// Pixel data
#include "vellum/pixmap.hpp"
#include "vellum/image.hpp"

// Fonts and text
#include "vellum/font.hpp"
#include "vellum/text.hpp"

// TrueType fonts (conditional - include <vellum/truetype_font.hpp> explicitly)
#if VELLUM_HAS_TRUETYPE
#include "vellum/truetype_font.hpp"
#endif

// Recording and commands
#include "vellum/recording.hpp"
#include "vellum/draw_op_visitor.hpp"

// Scene (user-facing drawing API)
#include "vellum/drawable.hpp"
#include "vellum/scene.hpp"
#include "vellum/geom.hpp"
#include "vellum/prerendered_scene.hpp"

// Backends
#include "vellum/backend.hpp"
#include "vellum/texture_cache.hpp"
#include "vellum/cpu_backend.hpp"
