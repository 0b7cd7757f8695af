#pragma once

/// @file gk.hpp
/// @brief Convenience header pulling in the public gatekeeper API.

#include "gk/version.hpp"

#include "gk/core/result.hpp"

#include "gk/foundation/config_manager.hpp"
#include "gk/foundation/error_code.hpp"
#include "gk/foundation/service_error.hpp"
#include "gk/foundation/service_logger.hpp"
#include "gk/foundation/service_result.hpp"
#include "gk/foundation/types.hpp"

#include "gk/service/account_service.hpp"
#include "gk/service/auth_config_loader.hpp"
#include "gk/service/auth_server.hpp"
#include "gk/service/auth_types.hpp"
#include "gk/service/authenticator.hpp"
#include "gk/service/confirmation_service.hpp"
#include "gk/service/cookie_vault.hpp"
#include "gk/service/input_validator.hpp"
#include "gk/service/mailer.hpp"
#include "gk/service/password_hasher.hpp"
#include "gk/service/password_reset_service.hpp"
#include "gk/service/request_context.hpp"
#include "gk/service/service_runner.hpp"
#include "gk/service/session_manager.hpp"
#include "gk/service/session_repository.hpp"
#include "gk/service/token_provider.hpp"
#include "gk/service/user_repository.hpp"
