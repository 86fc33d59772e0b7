#include "reasm/http/llhttp_parser.h"

#include <llhttp.h>

namespace reasm {
namespace http {

LLHttpParser::LLHttpParser(HttpParserType type,
                           HttpParserCallbacks* callbacks,
                           const HttpParserOptions& options)
    : callbacks_(callbacks),
      type_(type),
      options_(options),
      status_(ParserStatus::Ok) {
  parser_ = std::make_unique<llhttp_t>();
  settings_ = std::make_unique<llhttp_settings_t>();

  llhttp_settings_init(settings_.get());

  // All callbacks reach this instance through parser->data
  settings_->on_url = &LLHttpParser::onUrl;
  settings_->on_status = &LLHttpParser::onStatus;
  settings_->on_header_field = &LLHttpParser::onHeaderField;
  settings_->on_header_value = &LLHttpParser::onHeaderValue;
  settings_->on_header_value_complete = &LLHttpParser::onHeaderValueComplete;
  settings_->on_headers_complete = &LLHttpParser::onHeadersComplete;
  settings_->on_body = &LLHttpParser::onBody;
  settings_->on_message_complete = &LLHttpParser::onMessageComplete;

  llhttp_init(parser_.get(),
              type == HttpParserType::REQUEST ? HTTP_REQUEST : HTTP_RESPONSE,
              settings_.get());
  applyOptions();

  parser_->data = this;
}

LLHttpParser::~LLHttpParser() = default;

void LLHttpParser::applyOptions() {
  llhttp_set_lenient_keep_alive(parser_.get(),
                                options_.lenient_keep_alive ? 1 : 0);
}

size_t LLHttpParser::execute(const char* data, size_t length) {
  if (status_ == ParserStatus::Error) {
    return 0;
  }
  if (upgraded_) {
    if (length > 0) {
      status_ = ParserStatus::Error;
      data_after_upgrade_ = true;
    }
    return 0;
  }

  llhttp_errno_t err = llhttp_execute(parser_.get(), data, length);
  if (err == HPE_OK) {
    return length;
  }

  const char* error_pos = llhttp_get_error_pos(parser_.get());
  size_t consumed = 0;
  if (error_pos != nullptr && error_pos >= data) {
    consumed = static_cast<size_t>(error_pos - data);
  }

  if (err == HPE_PAUSED_UPGRADE) {
    // The CONNECT/Upgrade message itself completed; bytes after it belong
    // to the switched protocol
    llhttp_resume_after_upgrade(parser_.get());
    upgraded_ = true;
    if (consumed < length) {
      status_ = ParserStatus::Error;
      data_after_upgrade_ = true;
    }
    return consumed;
  }

  status_ = ParserStatus::Error;
  return consumed;
}

ParserStatus LLHttpParser::finish() {
  if (status_ == ParserStatus::Error || upgraded_) {
    return status_;
  }
  if (llhttp_finish(parser_.get()) != HPE_OK) {
    status_ = ParserStatus::Error;
  }
  return status_;
}

int LLHttpParser::errorCode() const {
  if (data_after_upgrade_) {
    return static_cast<int>(HPE_PAUSED_UPGRADE);
  }
  return static_cast<int>(llhttp_get_errno(parser_.get()));
}

std::string LLHttpParser::errorName() const {
  return llhttp_errno_name(static_cast<llhttp_errno_t>(errorCode()));
}

std::string LLHttpParser::getError() const {
  if (status_ != ParserStatus::Error) {
    return "";
  }
  if (data_after_upgrade_) {
    return "Data after CONNECT/Upgrade message";
  }
  const char* reason = llhttp_get_error_reason(parser_.get());
  return reason ? reason : "";
}

void LLHttpParser::reset() {
  llhttp_reset(parser_.get());
  applyOptions();
  parser_->data = this;

  status_ = ParserStatus::Ok;
  upgraded_ = false;
  data_after_upgrade_ = false;
}

// Static callback implementations

int LLHttpParser::onUrl(llhttp_t* parser, const char* data, size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onText(data, length));
  }
  return 0;
}

int LLHttpParser::onStatus(llhttp_t* parser, const char* data, size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onText(data, length));
  }
  return 0;
}

int LLHttpParser::onHeaderField(llhttp_t* parser,
                                const char* data,
                                size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onHeaderField(data, length));
  }
  return 0;
}

int LLHttpParser::onHeaderValue(llhttp_t* parser,
                                const char* data,
                                size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onHeaderValue(data, length));
  }
  return 0;
}

int LLHttpParser::onHeaderValueComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onHeaderValueComplete());
  }
  return 0;
}

int LLHttpParser::onHeadersComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    MessageHead head;
    if (self->type_ == HttpParserType::REQUEST) {
      head.method_name =
          llhttp_method_name(static_cast<llhttp_method_t>(parser->method));
      head.method = httpMethodFromString(head.method_name);
    } else {
      head.status = static_cast<HttpStatusCode>(parser->status_code);
    }
    head.version = HttpVersion(parser->http_major, parser->http_minor);
    return toCallbackResult(self->callbacks_->onHeadersComplete(head));
  }
  return 0;
}

int LLHttpParser::onBody(llhttp_t* parser, const char* data, size_t length) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onBody(data, length));
  }
  return 0;
}

int LLHttpParser::onMessageComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpParser*>(parser->data);
  if (self && self->callbacks_) {
    return toCallbackResult(self->callbacks_->onMessageComplete());
  }
  return 0;
}

int LLHttpParser::toCallbackResult(ParserCallbackResult result) {
  switch (result) {
    case ParserCallbackResult::Success:
      return HPE_OK;
    case ParserCallbackResult::Error:
      return HPE_USER;
    default:
      return HPE_OK;
  }
}

// LLHttpParserFactory implementation

HttpParserPtr LLHttpParserFactory::createParser(
    HttpParserType type,
    HttpParserCallbacks* callbacks,
    const HttpParserOptions& options) {
  return std::make_unique<LLHttpParser>(type, callbacks, options);
}

}  // namespace http
}  // namespace reasm
