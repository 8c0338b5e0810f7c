#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file trellis.hpp
 * @brief Umbrella header
 *
 * Components, leaf first:
 * - circular_buffer.hpp  fixed-capacity ring buffer
 * - thought_tree.hpp     per-session tree, placement rules, pruning
 * - mcts.hpp             UCB1, backpropagation, suggestion, best path
 * - session_tracker.hpp  activity, rate windows, eviction callbacks
 * - history.hpp          bounded linear history and branches
 * - security.hpp         sanitization, blocked patterns, rate limit gate
 * - thinking_modes.hpp   fast / expert / deep presets and guidance
 * - tree_manager.hpp     session -> tree registry
 * - metrics.hpp          counters and 60 s sliding rates
 * - health.hpp           aggregate health report
 * - service.hpp          ThinkingService, the composed verbs
 */

#include "circular_buffer.hpp"
#include "common.hpp"
#include "confidence.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "history.hpp"
#include "mcts.hpp"
#include "metrics.hpp"
#include "periodic_task.hpp"
#include "security.hpp"
#include "service.hpp"
#include "session_tracker.hpp"
#include "thinking_modes.hpp"
#include "thought.hpp"
#include "thought_tree.hpp"
#include "tree_manager.hpp"
