/**
 * main.h - Main application header
 *
 * Provides overview of main.cpp structure:
 * - Hardware setup (strip, PIR, indicator)
 * - Task registration on the cooperative runner
 * - Task bodies (render, motion, console, state refresh)
 */

#pragma once

#include <Arduino.h>
#include "storage.h"
#include "core/controller.h"
#include "core/task_runner.h"

// ===========================================================================
// Global State
// ===========================================================================

extern tron::Config config;
extern tron::TronController controller;
extern tron::TaskRunner runner;

// ===========================================================================
// Tasks (registered in priority order, render first)
// ===========================================================================

void renderTask(void* ctx, uint32_t now);
void motionTask(void* ctx, uint32_t now);
void consoleTask(void* ctx, uint32_t now);
void stateRefreshTask(void* ctx, uint32_t now);
