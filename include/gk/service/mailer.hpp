#pragma once

/// @file mailer.hpp
/// @brief Outbound mail collaborator interface.
///
/// The authentication flows hand a token and its purpose to a mailer; the
/// mailer owns link construction, templates and transport. Delivery is
/// fire-and-forget from the caller's point of view: failures are logged,
/// never retried and never surfaced to the user.

#include "gk/foundation/service_result.hpp"
#include "gk/service/auth_types.hpp"

#include <string>

namespace gk::service {

/// One message to deliver.
struct MailRequest {
    UserRecord user;
    std::string recipient;  ///< Address to send to (confirmable email for confirmations).
    std::string token;      ///< Signed token to embed in the link.
    TokenPurpose purpose = TokenPurpose::ConfirmEmail;
    std::string from;
};

/// Abstract mail transport.
class IMailer {
public:
    virtual ~IMailer() = default;

    [[nodiscard]] virtual gk::foundation::ServiceResult<void> deliver(const MailRequest& request) = 0;
};

/// Development mailer that writes deliveries to the log instead of sending.
class LoggingMailer : public IMailer {
public:
    [[nodiscard]] gk::foundation::ServiceResult<void> deliver(const MailRequest& request) override;
};

/// Hand @p request to @p mailer, logging and discarding any failure.
void dispatchMail(IMailer& mailer, const MailRequest& request);

}  // namespace gk::service
