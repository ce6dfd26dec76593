#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Focus/Viewport).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class Focus { Tree, Content };

struct Viewport { int top_line = 0; };
