// config/ProjectConfig.h
#pragma once

#include <Arduino.h>

// ==========================
// Project Identification
// ==========================
#ifndef PROJECT_NAME
#define PROJECT_NAME "N2O Stage Controller"
#endif
#define PROJECT_VERSION "1.0.0"

#ifdef AUTO_VERSION
#define FIRMWARE_VERSION PROJECT_VERSION "-" AUTO_VERSION
#else
#define FIRMWARE_VERSION PROJECT_VERSION
#endif

// ==========================
// Hardware Configuration
// ==========================
#ifndef SERIAL_BAUD_RATE
#define SERIAL_BAUD_RATE 921600
#endif

// GPIO pins driving the relay board inputs, indexed by relay channel 0-7.
// Boards with inverted (active-low) inputs define RELAY_ACTIVE_LOW.
#define RELAY_PIN_CH0 16
#define RELAY_PIN_CH1 17
#define RELAY_PIN_CH2 18
#define RELAY_PIN_CH3 19
#define RELAY_PIN_CH4 21
#define RELAY_PIN_CH5 22
#define RELAY_PIN_CH6 23
#define RELAY_PIN_CH7 25

// Nitrous layout built at boot (fixed for the controller's lifetime)
#ifndef NITROUS_STAGE_COUNT
#define NITROUS_STAGE_COUNT 3
#endif
#ifndef NITROUS_TIMER_COUNT
#define NITROUS_TIMER_COUNT 5
#endif

// ==========================
// Task Configuration
// ==========================
// The control task owns relay timing, it runs above every other application task
#define STACK_SIZE_NITROUS_CONTROL_TASK  6144  // snapshot build + observer delivery (JSON)
#define PRIORITY_NITROUS_CONTROL_TASK    (configMAX_PRIORITIES - 2)
#define CORE_NITROUS_CONTROL_TASK        1     // Keep core 0 for WiFi/BT
#define STACK_SIZE_LOOP_TASK             3072
