//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Decl.cpp
/// @brief Declaration parsing: program structure, classes, methods, fields,
///        annotations and types.
///
/// @details A program interleaves class declarations, top-level methods and
/// top-level statements. A method header is recognised by lookahead: optional
/// annotations and modifiers, a type, a name and an opening parenthesis.
///
//===----------------------------------------------------------------------===//

#include "frontends/pulse/Parser.hpp"

namespace pulse::frontend
{

namespace
{
bool isModifier(const Token &tok)
{
    return tok.isOneOf(TokenKind::KwPublic, TokenKind::KwPrivate, TokenKind::KwStatic);
}

AnnotationKind annotationKindFor(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::AtDeadline:
            return AnnotationKind::Deadline;
        case TokenKind::AtSensor:
            return AnnotationKind::Sensor;
        case TokenKind::AtSafetyCheck:
            return AnnotationKind::SafetyCheck;
        case TokenKind::AtRealTime:
            return AnnotationKind::RealTime;
        default:
            return AnnotationKind::Other;
    }
}
} // namespace

std::unique_ptr<Program> Parser::parseProgram()
{
    auto program = std::make_unique<Program>();

    while (!atEnd())
    {
        const size_t before = pos_;
        const bool declStart = check(TokenKind::KwClass) || peek().isAnnotation() ||
                               isModifier(peek()) || isMethodStart();
        if (!declStart)
        {
            if (StmtPtr stmt = parseStatement())
                program->statements.push_back(std::move(stmt));
        }
        else
        {
            std::vector<Annotation> annotations = parseAnnotations();
            Modifiers modifiers = parseModifiers();

            if (check(TokenKind::KwClass))
            {
                if (auto cls = parseClass(std::move(annotations), modifiers))
                    program->classes.push_back(std::move(cls));
            }
            else if (isMethodStart())
            {
                TypeRef returnType;
                parseType(returnType);
                Token nameTok = advance();
                if (auto method = parseMethodRest(
                        std::move(annotations), modifiers, std::move(returnType), nameTok, false))
                    program->methods.push_back(std::move(method));
                else
                    resyncAfterError();
            }
            else if (annotations.empty())
            {
                // `static int counter = 0;` at top level is an ordinary statement.
                if (StmtPtr stmt = parseStatement())
                    program->statements.push_back(std::move(stmt));
            }
            else
            {
                error("Expected method or class declaration after annotation");
                resyncAfterError();
            }
        }

        if (pos_ == before)
            advance();
    }

    return program;
}

//===----------------------------------------------------------------------===//
// Types
//===----------------------------------------------------------------------===//

size_t Parser::typeLengthAt(size_t offset) const
{
    const Token &tok = peek(offset);
    if (!tok.isTypeKeyword() && !tok.is(TokenKind::Identifier))
        return 0;
    if (check(TokenKind::LBracket, offset + 1) && check(TokenKind::RBracket, offset + 2))
        return 3;
    return 1;
}

bool Parser::parseType(TypeRef &out)
{
    const Token &tok = peek();
    if (!tok.isTypeKeyword() && !tok.is(TokenKind::Identifier))
    {
        error("Expected type, got '" + tok.text + "'");
        return false;
    }
    out.name = advance().text;
    out.isArray = false;
    if (check(TokenKind::LBracket) && check(TokenKind::RBracket, 1))
    {
        advance();
        advance();
        out.isArray = true;
    }
    return true;
}

bool Parser::isMethodStart() const
{
    size_t i = 0;
    while (peek(i).isAnnotation())
    {
        ++i;
        if (check(TokenKind::LParen, i))
        {
            int depth = 0;
            do
            {
                if (check(TokenKind::LParen, i))
                    ++depth;
                else if (check(TokenKind::RParen, i))
                    --depth;
                else if (check(TokenKind::Eof, i))
                    return false;
                ++i;
            } while (depth > 0);
        }
    }
    while (isModifier(peek(i)))
        ++i;

    const size_t typeLen = typeLengthAt(i);
    if (typeLen == 0)
        return false;
    i += typeLen;
    return check(TokenKind::Identifier, i) && check(TokenKind::LParen, i + 1);
}

//===----------------------------------------------------------------------===//
// Annotations and modifiers
//===----------------------------------------------------------------------===//

std::vector<Annotation> Parser::parseAnnotations()
{
    std::vector<Annotation> annotations;
    while (peek().isAnnotation())
    {
        Annotation annotation;
        if (parseAnnotation(annotation))
            annotations.push_back(std::move(annotation));
    }
    return annotations;
}

bool Parser::parseAnnotation(Annotation &out)
{
    Token tok = advance();
    out.kind = annotationKindFor(tok.kind);
    out.name = tok.stringValue;
    out.loc = tok.loc;

    if (!match(TokenKind::LParen))
        return true;
    out.hasParens = true;
    if (match(TokenKind::RParen))
        return true;

    do
    {
        AnnotationArg arg;
        // `@Sensor("temperature")` is shorthand for `value="temperature"`.
        if (check(TokenKind::Identifier) && check(TokenKind::Equal, 1))
        {
            arg.name = advance().text;
            advance();
        }
        else
        {
            arg.name = "value";
        }

        const bool negative = match(TokenKind::Minus);
        const Token &v = peek();
        switch (v.kind)
        {
            case TokenKind::IntegerLiteral:
                arg.value = negative ? -v.intValue : v.intValue;
                break;
            case TokenKind::NumberLiteral:
                arg.value = negative ? -v.doubleValue : v.doubleValue;
                break;
            case TokenKind::StringLiteral:
                arg.value = v.stringValue;
                break;
            case TokenKind::KwTrue:
                arg.value = true;
                break;
            case TokenKind::KwFalse:
                arg.value = false;
                break;
            default:
                error("Expected literal value in annotation @" + out.name);
                resyncAfterError();
                return false;
        }
        if (negative && !v.isOneOf(TokenKind::IntegerLiteral, TokenKind::NumberLiteral))
        {
            error("Expected number after '-' in annotation @" + out.name);
            return false;
        }
        advance();
        out.args.push_back(std::move(arg));
    } while (match(TokenKind::Comma));

    if (!expect(TokenKind::RParen, "')' to close annotation"))
        return false;
    return true;
}

Modifiers Parser::parseModifiers()
{
    Modifiers mods;
    while (isModifier(peek()))
    {
        Token tok = advance();
        if (tok.is(TokenKind::KwPublic))
            mods.isPublic = true;
        else if (tok.is(TokenKind::KwPrivate))
            mods.isPrivate = true;
        else
            mods.isStatic = true;
    }
    return mods;
}

//===----------------------------------------------------------------------===//
// Classes and members
//===----------------------------------------------------------------------===//

std::unique_ptr<ClassDecl> Parser::parseClass(std::vector<Annotation> annotations,
                                              Modifiers modifiers)
{
    Token classTok = advance();
    auto cls = std::make_unique<ClassDecl>();
    cls->loc = classTok.loc;
    cls->modifiers = modifiers;
    cls->annotations = std::move(annotations);

    Token nameTok;
    if (!expect(TokenKind::Identifier, "class name", &nameTok))
    {
        resyncAfterError();
        return nullptr;
    }
    cls->name = nameTok.text;

    if (!expect(TokenKind::LBrace, "'{' after class name"))
    {
        resyncAfterError();
        return nullptr;
    }

    while (!check(TokenKind::RBrace) && !atEnd())
    {
        const size_t before = pos_;
        std::vector<Annotation> memberAnnotations = parseAnnotations();
        Modifiers memberMods = parseModifiers();

        if (check(TokenKind::Identifier) && peek().text == cls->name && check(TokenKind::LParen, 1))
        {
            Token ctorTok = advance();
            TypeRef selfType{cls->name, false};
            if (auto ctor = parseMethodRest(
                    std::move(memberAnnotations), memberMods, selfType, ctorTok, true))
                cls->methods.push_back(std::move(ctor));
            else
                resyncAfterError();
        }
        else
        {
            TypeRef type;
            Token memberName;
            if (!parseType(type) || !expect(TokenKind::Identifier, "member name", &memberName))
            {
                resyncAfterError();
            }
            else if (check(TokenKind::LParen))
            {
                if (auto method = parseMethodRest(
                        std::move(memberAnnotations), memberMods, std::move(type), memberName, false))
                    cls->methods.push_back(std::move(method));
                else
                    resyncAfterError();
            }
            else if (auto field = parseFieldRest(
                         std::move(memberAnnotations), memberMods, std::move(type), memberName))
            {
                cls->fields.push_back(std::move(field));
            }
            else
            {
                resyncAfterError();
            }
        }

        if (pos_ == before)
            advance();
    }

    expect(TokenKind::RBrace, "'}' to close class body");
    return cls;
}

std::unique_ptr<MethodDecl> Parser::parseMethodRest(std::vector<Annotation> annotations,
                                                    Modifiers modifiers,
                                                    TypeRef returnType,
                                                    Token nameTok,
                                                    bool isConstructor)
{
    auto method = std::make_unique<MethodDecl>();
    method->loc = nameTok.loc;
    method->modifiers = modifiers;
    method->annotations = std::move(annotations);
    method->returnType = std::move(returnType);
    method->name = nameTok.text;
    method->isConstructor = isConstructor;

    if (!expect(TokenKind::LParen, "'(' after method name"))
        return nullptr;
    if (!parseParameters(method->params))
        return nullptr;

    method->body = parseBlock();
    if (!method->body)
        return nullptr;
    return method;
}

bool Parser::parseParameters(std::vector<Param> &params)
{
    if (match(TokenKind::RParen))
        return true;
    do
    {
        Param param;
        param.loc = peek().loc;
        if (!parseType(param.type))
            return false;
        Token nameTok;
        if (!expect(TokenKind::Identifier, "parameter name", &nameTok))
            return false;
        param.name = nameTok.text;
        params.push_back(std::move(param));
    } while (match(TokenKind::Comma));
    return expect(TokenKind::RParen, "')' after parameters");
}

std::unique_ptr<FieldDecl> Parser::parseFieldRest(std::vector<Annotation> annotations,
                                                  Modifiers modifiers,
                                                  TypeRef type,
                                                  Token nameTok)
{
    auto field = std::make_unique<FieldDecl>();
    field->loc = nameTok.loc;
    field->modifiers = modifiers;
    field->annotations = std::move(annotations);
    field->type = std::move(type);
    field->name = nameTok.text;

    if (match(TokenKind::Equal))
    {
        field->init = parseExpression();
        if (!field->init)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon, "';' after field declaration"))
        return nullptr;
    return field;
}

} // namespace pulse::frontend
