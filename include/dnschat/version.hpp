// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#define DNSCHAT_VERSION "1.0.0"
#define DNSCHAT_PROTOCOL_VERSION 1

#ifndef DNSCHAT_GIT_SHA
#define DNSCHAT_GIT_SHA "unknown"
#endif

#define DNSCHAT_DEFAULT_CONFIG_FILE_PATH "/etc/dnschat/dnschat.cfg"
