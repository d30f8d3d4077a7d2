#include "parsing/MachineParser.h"
#include "common/FileLoadingHelper.h"
#include "common/Logger.h"
#include "parsing/Lexer.h"
#include <filesystem>
#include <utility>

namespace TSM {

namespace {

const char *const KEY_NAME = "name";
const char *const KEY_DERIVE_STATES = "derive_states";
const char *const KEY_DERIVE_EVENTS = "derive_events";
const char *const KEY_TRANSITIONS = "transitions";

const char *const EXPECTED_KEYS = "expected 'name', 'derive_states', 'derive_events' or 'transitions'";

}  // namespace

std::shared_ptr<MachineSource> MachineParser::parseFile(const std::string &filename) {
    clearDiagnostics();

    if (!std::filesystem::exists(FileLoadingHelper::normalizePath(filename))) {
        addError(ErrorKind::ConfigurationError, "File not found: " + filename, {});
        return nullptr;
    }

    std::string content;
    if (!FileLoadingHelper::loadFileContent(filename, content)) {
        addError(ErrorKind::ConfigurationError, "Cannot read file: " + filename, {});
        return nullptr;
    }

    LOG_DEBUG("MachineParser: Parsing file: {}", filename);
    return parseContent(content, filename);
}

std::shared_ptr<MachineSource> MachineParser::parseContent(const std::string &content, const std::string &sourceName) {
    clearDiagnostics();
    sourceName_ = sourceName;

    Lexer lexer(content);
    tokens_ = lexer.tokenize();
    pos_ = 0;

    auto source = parseTokens();
    if (!source || hasErrors()) {
        LOG_DEBUG("MachineParser: '{}' has {} error(s)", sourceName_, diagnostics_.size());
        return nullptr;
    }

    LOG_DEBUG("MachineParser: Parsed {} clause(s) from '{}'", source->clauses.size(), sourceName_);
    return source;
}

bool MachineParser::hasErrors() const {
    return !diagnostics_.empty();
}

const DiagnosticList &MachineParser::getDiagnostics() const {
    return diagnostics_;
}

std::shared_ptr<MachineSource> MachineParser::parseTokens() {
    auto source = std::make_shared<MachineSource>();
    source->sourceName = sourceName_;

    std::set<std::string> seenKeys;
    bool sawTransitions = false;
    while (!sawTransitions) {
        if (check(TokenType::EndOfInput)) {
            addError(ErrorKind::SyntaxError, "expected 'transitions' block", peek().position, "",
                     "add 'transitions: { *Initial + Event = Target }'");
            return nullptr;
        }
        if (!parseMetadataEntry(*source, seenKeys, sawTransitions)) {
            return nullptr;
        }
    }

    // The transitions block closes the input
    if (!check(TokenType::EndOfInput)) {
        const Token &extra = peek();
        if (extra.is(TokenType::Invalid)) {
            reportInvalidToken(extra, "");
        } else {
            addError(ErrorKind::SyntaxError, "unexpected " + describe(extra) + " after the transitions block",
                     extra.position);
        }
        return nullptr;
    }

    return source;
}

bool MachineParser::parseMetadataEntry(MachineSource &source, std::set<std::string> &seenKeys, bool &sawTransitions) {
    const Token &keyToken = peek();
    if (keyToken.is(TokenType::Invalid)) {
        reportInvalidToken(keyToken, "");
        return false;
    }
    if (!keyToken.is(TokenType::Identifier)) {
        addError(ErrorKind::SyntaxError, std::string(EXPECTED_KEYS) + ", found " + describe(keyToken),
                 keyToken.position);
        return false;
    }

    const std::string key = keyToken.lexeme;
    if (key != KEY_NAME && key != KEY_DERIVE_STATES && key != KEY_DERIVE_EVENTS && key != KEY_TRANSITIONS) {
        addError(ErrorKind::SyntaxError, "unknown key '" + key + "'; " + EXPECTED_KEYS, keyToken.position);
        return false;
    }
    if (!seenKeys.insert(key).second) {
        addError(ErrorKind::SyntaxError, "key '" + key + "' is given more than once", keyToken.position);
        return false;
    }
    advance();

    if (!match(TokenType::Colon)) {
        addError(ErrorKind::SyntaxError, "expected ':' after '" + key + "', found " + describe(peek()),
                 peek().position);
        return false;
    }

    if (key == KEY_TRANSITIONS) {
        sawTransitions = true;
        return parseTransitionsBlock(source);
    }

    if (key == KEY_NAME) {
        const Token &nameToken = peek();
        if (!nameToken.is(TokenType::Identifier)) {
            addError(ErrorKind::SyntaxError, "expected machine name after 'name:', found " + describe(nameToken),
                     nameToken.position);
            return false;
        }
        source.name = Identifier{nameToken.lexeme, nameToken.position};
        advance();
    } else {
        auto list = parseIdentifierList(key);
        if (!list) {
            return false;
        }
        if (key == KEY_DERIVE_STATES) {
            source.deriveStates = std::move(*list);
        } else {
            source.deriveEvents = std::move(*list);
        }
    }

    match(TokenType::Comma);
    return true;
}

std::optional<std::vector<Identifier>> MachineParser::parseIdentifierList(const std::string &key) {
    if (!match(TokenType::LBracket)) {
        addError(ErrorKind::SyntaxError, "expected '[' after '" + key + ":', found " + describe(peek()),
                 peek().position);
        return std::nullopt;
    }

    std::vector<Identifier> identifiers;
    while (!check(TokenType::RBracket)) {
        const Token &token = peek();
        if (token.is(TokenType::Invalid)) {
            reportInvalidToken(token, "");
            return std::nullopt;
        }
        if (!token.is(TokenType::Identifier)) {
            addError(ErrorKind::SyntaxError, "expected capability name in '" + key + "', found " + describe(token),
                     token.position);
            return std::nullopt;
        }
        identifiers.push_back(Identifier{token.lexeme, token.position});
        advance();

        if (!match(TokenType::Comma)) {
            break;
        }
    }

    if (!match(TokenType::RBracket)) {
        addError(ErrorKind::SyntaxError, "expected ']' to close '" + key + "', found " + describe(peek()),
                 peek().position);
        return std::nullopt;
    }
    return identifiers;
}

bool MachineParser::parseTransitionsBlock(MachineSource &source) {
    const Token &open = peek();
    if (!match(TokenType::LBrace)) {
        addError(ErrorKind::SyntaxError, "expected '{' after 'transitions:', found " + describe(open), open.position);
        return false;
    }

    if (check(TokenType::RBrace)) {
        addError(ErrorKind::SyntaxError, "transitions block is empty", open.position, "",
                 "add at least one clause, e.g. '*Idle + Start = Running'");
        advance();
        return false;
    }

    size_t index = 0;
    while (true) {
        if (check(TokenType::EndOfInput)) {
            addError(ErrorKind::SyntaxError, "unterminated transitions block; expected '}'", peek().position);
            return false;
        }

        size_t clauseStart = pos_;
        auto clause = parseClause(index++);
        if (clause) {
            if (check(TokenType::Comma) || check(TokenType::RBrace)) {
                source.clauses.push_back(std::move(*clause));
            } else {
                const Token &unexpected = peek();
                if (unexpected.is(TokenType::Invalid)) {
                    reportInvalidToken(unexpected, clauseTextFrom(clauseStart));
                } else if (!unexpected.is(TokenType::EndOfInput)) {
                    addError(ErrorKind::SyntaxError, "expected ',' or '}' after clause, found " + describe(unexpected),
                             unexpected.position, clauseTextFrom(clauseStart));
                }
                synchronizeToClauseEnd();
            }
        } else {
            synchronizeToClauseEnd();
        }

        if (match(TokenType::Comma)) {
            if (match(TokenType::RBrace)) {
                break;  // Trailing comma
            }
            continue;
        }
        if (match(TokenType::RBrace)) {
            break;
        }

        addError(ErrorKind::SyntaxError, "unterminated transitions block; expected '}'", peek().position);
        return false;
    }

    validateInitialMarkers(source, open.position);
    return !hasErrors();
}

std::optional<Clause> MachineParser::parseClause(size_t index) {
    size_t start = pos_;
    SourcePosition position = peek().position;

    auto statePattern = parseStatePattern(start);
    if (!statePattern) {
        return std::nullopt;
    }

    if (!match(TokenType::Plus)) {
        const Token &token = peek();
        if (token.is(TokenType::Invalid)) {
            reportInvalidToken(token, clauseTextFrom(start));
        } else {
            addError(ErrorKind::SyntaxError, "expected '+' after the source states, found " + describe(token),
                     token.position, clauseTextFrom(start), "clauses have the form 'Source + Event = Target'");
        }
        return std::nullopt;
    }

    auto eventPattern = parseEventPattern(start);
    if (!eventPattern) {
        return std::nullopt;
    }

    auto target = parseTarget(start);
    if (!target) {
        return std::nullopt;
    }

    Clause clause;
    clause.source = std::move(*statePattern);
    clause.events = std::move(*eventPattern);
    clause.target = std::move(*target);
    clause.text = clauseTextFrom(start);
    clause.position = position;
    clause.index = index;

    LOG_TRACE("MachineParser: Clause #{}: {}", index, clause.text);
    return clause;
}

std::optional<StatePattern> MachineParser::parseStatePattern(size_t clauseStart) {
    StatePattern pattern;
    pattern.position = peek().position;

    if (match(TokenType::Underscore)) {
        pattern.kind = StatePattern::Kind::Wildcard;
        return pattern;
    }

    pattern.kind = StatePattern::Kind::Concrete;
    while (true) {
        SourcePosition markerPosition = peek().position;
        bool initial = match(TokenType::Star);
        const Token &token = peek();

        if (token.is(TokenType::Identifier)) {
            pattern.alternatives.push_back(StateAlternative{Identifier{token.lexeme, token.position}, initial});
            advance();
        } else if (initial && token.is(TokenType::Underscore)) {
            // Checked before the combination rule: '*_' is always a marker error, wherever it appears
            addError(ErrorKind::InitialStateError, "the wildcard source '_' cannot be marked as the initial state",
                     markerPosition, clauseTextFrom(clauseStart), "put '*' in front of a concrete state");
            return std::nullopt;
        } else if (token.is(TokenType::Underscore)) {
            addError(ErrorKind::SyntaxError, "the wildcard '_' cannot be combined with other source states",
                     token.position, clauseTextFrom(clauseStart), "write a separate '_ + Event = Target' clause");
            return std::nullopt;
        } else if (token.is(TokenType::Invalid)) {
            reportInvalidToken(token, clauseTextFrom(clauseStart));
            return std::nullopt;
        } else {
            addError(ErrorKind::SyntaxError, "expected source state, found " + describe(token), token.position,
                     clauseTextFrom(clauseStart));
            return std::nullopt;
        }

        if (!match(TokenType::Pipe)) {
            break;
        }
    }
    return pattern;
}

std::optional<EventPattern> MachineParser::parseEventPattern(size_t clauseStart) {
    EventPattern pattern;
    while (true) {
        const Token &token = peek();

        if (token.is(TokenType::Identifier)) {
            pattern.alternatives.push_back(Identifier{token.lexeme, token.position});
            advance();
        } else if (token.is(TokenType::Underscore)) {
            addError(ErrorKind::SyntaxError, "events cannot be wildcards", token.position, clauseTextFrom(clauseStart),
                     "name every event explicitly, joining alternatives with '|'");
            return std::nullopt;
        } else if (token.is(TokenType::Star)) {
            addError(ErrorKind::SyntaxError, "'*' marks the initial state and cannot prefix an event", token.position,
                     clauseTextFrom(clauseStart));
            return std::nullopt;
        } else if (token.is(TokenType::Invalid)) {
            reportInvalidToken(token, clauseTextFrom(clauseStart));
            return std::nullopt;
        } else {
            addError(ErrorKind::SyntaxError, "expected event name, found " + describe(token), token.position,
                     clauseTextFrom(clauseStart));
            return std::nullopt;
        }

        if (!match(TokenType::Pipe)) {
            break;
        }
    }
    return pattern;
}

std::optional<TargetSpec> MachineParser::parseTarget(size_t clauseStart) {
    TargetSpec target;
    target.position = peek().position;

    if (match(TokenType::Equals)) {
        const Token &token = peek();
        target.position = token.position;

        if (token.is(TokenType::Underscore)) {
            target.kind = TargetSpec::Kind::SameAsSource;
            advance();
            return target;
        }
        if (token.is(TokenType::Identifier)) {
            target.kind = TargetSpec::Kind::State;
            target.identifier = Identifier{token.lexeme, token.position};
            advance();
            return target;
        }

        if (token.is(TokenType::Invalid)) {
            reportInvalidToken(token, clauseTextFrom(clauseStart));
        } else {
            addError(ErrorKind::SyntaxError, "expected target state or '_' after '=', found " + describe(token),
                     token.position, clauseTextFrom(clauseStart));
        }
        return std::nullopt;
    }

    // "State + Event" without a target stays in the source state
    if (check(TokenType::Comma) || check(TokenType::RBrace)) {
        target.kind = TargetSpec::Kind::SameAsSource;
        return target;
    }

    const Token &token = peek();
    if (token.is(TokenType::Invalid)) {
        reportInvalidToken(token, clauseTextFrom(clauseStart));
    } else {
        addError(ErrorKind::SyntaxError, "expected '=' and a target state, found " + describe(token), token.position,
                 clauseTextFrom(clauseStart));
    }
    return std::nullopt;
}

void MachineParser::validateInitialMarkers(const MachineSource &source, const SourcePosition &blockPosition) {
    const StateAlternative *initial = nullptr;

    for (const auto &clause : source.clauses) {
        for (const auto &alternative : clause.source.alternatives) {
            if (!alternative.initial) {
                continue;
            }
            if (!initial) {
                initial = &alternative;
                continue;
            }

            const auto &first = initial->identifier;
            addError(ErrorKind::InitialStateError,
                     "more than one initial state: '" + alternative.identifier.name + "' is marked with '*' but '" +
                         first.name + "' (line " + std::to_string(first.position.line) + ") already is",
                     alternative.identifier.position, clause.text, "keep exactly one '*' marker");
        }
    }

    // A missing marker may sit in a clause that failed to parse
    if (!initial && !hasErrors()) {
        addError(ErrorKind::InitialStateError, "no initial state: no clause marks its source state with '*'",
                 blockPosition, "", "prefix the starting state of one clause with '*', e.g. '*Idle + Start = Running'");
    }
}

void MachineParser::synchronizeToClauseEnd() {
    while (!check(TokenType::Comma) && !check(TokenType::RBrace) && !check(TokenType::EndOfInput)) {
        advance();
    }
}

std::string MachineParser::clauseTextFrom(size_t firstToken) const {
    std::string text;
    for (size_t i = firstToken; i < tokens_.size(); ++i) {
        const Token &token = tokens_[i];
        if (token.is(TokenType::Comma) || token.is(TokenType::RBrace) || token.is(TokenType::EndOfInput)) {
            break;
        }
        if (!text.empty() && !tokens_[i - 1].is(TokenType::Star)) {
            text += ' ';
        }
        text += token.lexeme;
    }
    return text;
}

std::string MachineParser::describe(const Token &token) const {
    if (token.is(TokenType::Identifier)) {
        return "identifier '" + token.lexeme + "'";
    }
    return std::string(tokenTypeToString(token.type));
}

const Token &MachineParser::peek(size_t ahead) const {
    size_t index = pos_ + ahead;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token &MachineParser::advance() {
    const Token &token = tokens_[pos_];
    if (!token.is(TokenType::EndOfInput)) {
        pos_++;
    }
    return token;
}

bool MachineParser::check(TokenType type) const {
    return peek().is(type);
}

bool MachineParser::match(TokenType type) {
    if (!check(type)) {
        return false;
    }
    advance();
    return true;
}

void MachineParser::addError(ErrorKind kind, const std::string &message, const SourcePosition &position,
                             const std::string &clauseText, const std::string &hint) {
    LOG_DEBUG("MachineParser - {}: {}", errorKindName(kind), message);
    diagnostics_.emplace_back(kind, message, position, clauseText, hint);
}

void MachineParser::reportInvalidToken(const Token &token, const std::string &clauseText) {
    if (token.lexeme == "/*") {
        addError(ErrorKind::SyntaxError, "unterminated block comment", token.position, clauseText);
    } else {
        addError(ErrorKind::SyntaxError, "unexpected character '" + token.lexeme + "'", token.position, clauseText);
    }
}

void MachineParser::clearDiagnostics() {
    diagnostics_.clear();
}

}  // namespace TSM
