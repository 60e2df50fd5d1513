/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef RELEASE_H
#define RELEASE_H

#include <string>

#define DESK_LOCKER_VERSION_MAJOR 0
#define DESK_LOCKER_VERSION_MINOR 3
#define DESK_LOCKER_VERSION_PATCH 0
#define DESK_LOCKER_VERSION_TWEAK 0

#define DL__STRINGIFY(x) #x
#define DL_STRINGIFY(x) DL__STRINGIFY(x)

#define DESK_LOCKER_VERSION_STRING \
DL_STRINGIFY(DESK_LOCKER_VERSION_MAJOR) "." \
    DL_STRINGIFY(DESK_LOCKER_VERSION_MINOR) "." \
    DL_STRINGIFY(DESK_LOCKER_VERSION_PATCH) "." \
    DL_STRINGIFY(DESK_LOCKER_VERSION_TWEAK)

const std::string g_version_datetime = "20251019";

const std::string g_version = std::string("version ") + std::string(DESK_LOCKER_VERSION_STRING) + " - " + g_version_datetime;

#endif // RELEASE_H
