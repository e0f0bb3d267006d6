#pragma once

#include "evaluator.hpp"

// Fills the primordial prototypes with their built-in methods and creates the
// standard constructors. With `install_bindings` the constructors (plus Math,
// NaN, Infinity, undefined and the parse helpers) also become global bindings.
void init_globals(Evaluator& engine, bool install_bindings);
