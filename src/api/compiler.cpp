#include "lusitano/compiler.hpp"

#include "common/assert.hpp"
#include "common/error.hpp"
#include "compiler/compiler.hpp"
#include "compiler/diagnostics.hpp"

namespace lusitano::api {

const char* phase_str(Phase phase) {
    switch (phase) {
    case Phase::Lexical:
        return "lexical";
    case Phase::Syntax:
        return "syntax";
    case Phase::Semantic:
        return "semantic";
    }
    return "<INVALID PHASE>";
}

const char* severity_str(Severity severity) {
    switch (severity) {
    case Severity::Warning:
        return "WARNING";
    case Severity::Error:
        return "ERROR";
    }
    return "<INVALID SEVERITY>";
}

static Phase to_external(lusitano::Phase phase) {
    switch (phase) {
    case lusitano::Phase::Lexical:
        return Phase::Lexical;
    case lusitano::Phase::Syntax:
        return Phase::Syntax;
    case lusitano::Phase::Semantic:
        return Phase::Semantic;
    }
    LUSITANO_UNREACHABLE("Invalid phase.");
}

static Severity to_external(Diagnostics::Level level) {
    switch (level) {
    case Diagnostics::Error:
        return Severity::Error;
    case Diagnostics::Warning:
        return Severity::Warning;
    }
    LUSITANO_UNREACHABLE("Invalid diagnostic level.");
}

static CompilerMessage
to_external(const lusitano::Compiler& compiler, const Diagnostics::Message& message) {
    CompilerMessage msg;
    msg.phase = to_external(message.phase);
    msg.severity = to_external(message.level);
    msg.kind = std::string(to_string(message.kind));
    msg.file = compiler.file_name();
    if (auto pos = compiler.cursor_pos(message.range)) {
        msg.line = pos.line();
        msg.column = pos.column();
    }
    msg.text = message.text;
    msg.expected = message.expected;
    msg.found = message.found;
    return msg;
}

struct Compiler::Impl {
    std::string file_name;
    std::string source;
    MessageCallback message_callback;

    bool dump_tokens = false;
    bool dump_ast = false;
    bool dump_symbols = false;
    bool header = true;
    bool call_main = true;

    bool started = false;
    std::vector<CompilerMessage> messages;
    std::optional<CompilerResult> result;
};

Compiler::Compiler(std::string file_name, std::string source)
    : impl_(std::make_unique<Impl>()) {
    if (file_name.empty())
        LUSITANO_ERROR_WITH_CODE(Errc::BadArg, "The file name must not be empty.");

    impl_->file_name = std::move(file_name);
    impl_->source = std::move(source);
}

Compiler::~Compiler() {}

Compiler::Compiler(Compiler&& other) noexcept = default;

Compiler& Compiler::operator=(Compiler&& other) noexcept = default;

void Compiler::set_message_callback(MessageCallback callback) {
    auto& comp = impl();
    if (comp.started)
        LUSITANO_ERROR_WITH_CODE(Errc::BadState, "The compiler already ran.");
    comp.message_callback = std::move(callback);
}

void Compiler::request_attachment(Attachment attachment) {
    auto& comp = impl();
    if (comp.started)
        LUSITANO_ERROR_WITH_CODE(Errc::BadState, "The compiler already ran.");

    switch (attachment) {
    case Attachment::Tokens:
        comp.dump_tokens = true;
        return;
    case Attachment::Ast:
        comp.dump_ast = true;
        return;
    case Attachment::Symbols:
        comp.dump_symbols = true;
        return;
    }
    LUSITANO_ERROR_WITH_CODE(Errc::BadArg, "Invalid attachment.");
}

void Compiler::emit_header(bool enabled) {
    impl().header = enabled;
}

void Compiler::call_main(bool enabled) {
    impl().call_main = enabled;
}

void Compiler::run() {
    auto& comp = impl();
    if (comp.started)
        LUSITANO_ERROR_WITH_CODE(Errc::BadState, "The compiler already ran.");
    comp.started = true;

    CompilerOptions options;
    options.analyze = options.generate = true;
    options.header = comp.header;
    options.call_main = comp.call_main;
    options.keep_tokens = comp.dump_tokens;
    options.keep_ast = comp.dump_ast;
    options.keep_symbols = comp.dump_symbols;

    lusitano::Compiler compiler(comp.file_name, std::move(comp.source), options);
    comp.source.clear();

    comp.result = compiler.run();
    for (const auto& message : compiler.diag().messages()) {
        comp.messages.push_back(to_external(compiler, message));
        if (comp.message_callback)
            comp.message_callback(comp.messages.back());
    }
}

bool Compiler::success() const {
    auto& comp = impl();
    return comp.result && comp.result->success;
}

const std::vector<CompilerMessage>& Compiler::messages() const {
    return impl().messages;
}

bool Compiler::has_code() const {
    auto& comp = impl();
    return comp.result && comp.result->python.has_value();
}

const std::string& Compiler::code() const {
    if (!has_code())
        LUSITANO_ERROR_WITH_CODE(Errc::BadState, "No code was generated.");
    return *impl().result->python;
}

std::optional<std::string> Compiler::attachment(Attachment attachment) const {
    auto& comp = impl();
    if (!comp.result)
        return {};

    switch (attachment) {
    case Attachment::Tokens:
        return comp.result->tokens;
    case Attachment::Ast:
        return comp.result->ast;
    case Attachment::Symbols:
        return comp.result->symbols;
    }
    LUSITANO_ERROR_WITH_CODE(Errc::BadArg, "Invalid attachment.");
}

Compiler::Impl& Compiler::impl() const {
    if (!impl_)
        LUSITANO_ERROR_WITH_CODE(Errc::BadState, "The compiler instance was moved from.");
    return *impl_;
}

CompileResult compile(std::string file_name, std::string source, const CompileSettings& settings) {
    Compiler compiler(std::move(file_name), std::move(source));
    compiler.emit_header(settings.emit_header);
    compiler.call_main(settings.call_main);
    for (auto attachment : settings.attachments)
        compiler.request_attachment(attachment);
    if (settings.message_callback)
        compiler.set_message_callback(settings.message_callback);

    compiler.run();

    CompileResult result;
    result.success = compiler.success();
    result.messages = compiler.messages();
    if (compiler.has_code())
        result.code = compiler.code();
    result.tokens = compiler.attachment(Attachment::Tokens);
    result.ast = compiler.attachment(Attachment::Ast);
    result.symbols = compiler.attachment(Attachment::Symbols);
    return result;
}

} // namespace lusitano::api
