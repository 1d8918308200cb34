#ifndef TRON_H
#define TRON_H

/**
 * TRON - Motion-triggered chase animations for warm/cool LED strips
 *
 * Main include file - pulls in all core components
 *
 * Usage:
 *   #include "tron.h"
 *
 *   tron::TronController controller;
 *
 *   void setup() {
 *       controller.begin(60, &sink);
 *   }
 *
 *   void loop() {
 *       controller.update(millis());
 *   }
 */

// Core types
#include "core/param_schema.h"
#include "core/control_state.h"
#include "core/burst.h"
#include "core/burst_queue.h"
#include "core/compositor.h"
#include "core/scheduler.h"
#include "core/validator.h"
#include "core/admission.h"
#include "core/motion_trigger.h"
#include "core/command_queue.h"
#include "core/controller.h"
#include "core/task_runner.h"

#endif // TRON_H
