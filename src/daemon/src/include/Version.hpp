/*
 * HwmonFanControl — version
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

// Normally injected by the build from project(VERSION ...)
#ifndef HFCD_VERSION
#define HFCD_VERSION "0.1.0"
#endif
