/// @file mailer.cpp
/// @brief LoggingMailer and fire-and-forget dispatch.

#include "gk/service/mailer.hpp"

#include "gk/foundation/service_logger.hpp"

namespace gk::service {

using gk::foundation::LogCategory;
using gk::foundation::LogContext;
using gk::foundation::LogLevel;
using gk::foundation::ServiceResult;

ServiceResult<void> LoggingMailer::deliver(const MailRequest& request) {
    LogContext ctx;
    ctx.userId = request.user.id;
    ctx.extra["to"] = request.recipient;
    ctx.extra["from"] = request.from;
    ctx.extra["purpose"] = std::string(tokenPurposeName(request.purpose));
    GK_LOG_CTX(LogLevel::Info, LogCategory::Mail, "mail queued", ctx);

    GK_LOG_DEBUG(LogCategory::Mail, "mail token: " + request.token);
    return ServiceResult<void>::ok();
}

void dispatchMail(IMailer& mailer, const MailRequest& request) {
    auto result = mailer.deliver(request);
    if (!result) {
        LogContext ctx;
        ctx.userId = request.user.id;
        ctx.extra["purpose"] = std::string(tokenPurposeName(request.purpose));
        GK_LOG_CTX(LogLevel::Error, LogCategory::Mail,
                   "mail delivery failed: " + std::string(result.error().message()), ctx);
    }
}

}  // namespace gk::service
