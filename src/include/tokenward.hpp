#pragma once

#include "oauth2_error.hpp"
#include "oauth2_types.hpp"
#include "pkce.hpp"
#include "credential_store.hpp"
#include "refresh_lock.hpp"
#include "callback_listener.hpp"
#include "device_flow.hpp"
#include "oauth2_client.hpp"
#include "token_refresher.hpp"
#include "tokenward_tracing.hpp"
