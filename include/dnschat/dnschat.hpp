// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "version.hpp"
#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "core/thread_pool.hpp"
#include "crypto/crypto_box.hpp"
#include "crypto/secure_rng.hpp"
#include "llm/conversation.hpp"
#include "llm/llm_backend.hpp"
#include "llm/openai_backend.hpp"
#include "network/dns/dns_message.hpp"
#include "network/dns/dns_types.hpp"
#include "network/dns_server.hpp"
#include "network/http_client.hpp"
#include "network/udp_query_transport.hpp"
#include "parsers/json.hpp"
#include "parsers/minimal_toml.hpp"
#include "tunnel/chunking.hpp"
#include "tunnel/client.hpp"
#include "tunnel/protocol.hpp"
#include "tunnel/resolver.hpp"
#include "tunnel/session_store.hpp"
#include "util/base36.hpp"
#include "util/base64_url.hpp"
