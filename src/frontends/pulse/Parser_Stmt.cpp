//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing for the Pulse parser.
///
//===----------------------------------------------------------------------===//

#include "frontends/pulse/Parser.hpp"

namespace pulse::frontend
{

StmtPtr Parser::parseStatement()
{
    if (++stmtDepth_ > kMaxStmtDepth)
    {
        --stmtDepth_;
        nestingTooDeep("statement", kMaxStmtDepth);
        return nullptr;
    }
    DepthGuard guard{stmtDepth_};

    StmtPtr stmt;
    const SourceLoc loc = peek().loc;

    switch (peek().kind)
    {
        case TokenKind::LBrace:
            stmt = parseBlock();
            break;
        case TokenKind::KwIf:
            stmt = parseIfStmt();
            break;
        case TokenKind::KwWhile:
            stmt = parseWhileStmt();
            break;
        case TokenKind::KwFor:
            stmt = parseForStmt();
            break;
        case TokenKind::KwReturn:
            stmt = parseReturnStmt();
            break;
        case TokenKind::KwBreak:
            advance();
            if (expect(TokenKind::Semicolon, "';' after 'break'"))
                stmt = std::make_unique<BreakStmt>(loc);
            break;
        case TokenKind::KwContinue:
            advance();
            if (expect(TokenKind::Semicolon, "';' after 'continue'"))
                stmt = std::make_unique<ContinueStmt>(loc);
            break;
        case TokenKind::Semicolon:
            // Empty statement.
            advance();
            stmt = std::make_unique<BlockStmt>(loc);
            break;
        default:
            if (isVarDeclStart())
                stmt = parseVarDecl(true);
            else
                stmt = parseExprStmt(true);
            break;
    }

    if (!stmt)
        resyncAfterError();
    return stmt;
}

std::unique_ptr<BlockStmt> Parser::parseBlock()
{
    Token open;
    if (!expect(TokenKind::LBrace, "'{'", &open))
        return nullptr;

    auto block = std::make_unique<BlockStmt>(open.loc);
    while (!check(TokenKind::RBrace) && !atEnd())
    {
        const size_t before = pos_;
        StmtPtr stmt = parseStatement();
        if (stmt)
            block->statements.push_back(std::move(stmt));
        else if (pos_ == before)
            advance();
    }

    if (!expect(TokenKind::RBrace, "'}' to close block"))
        return nullptr;
    return block;
}

bool Parser::isVarDeclStart() const
{
    const size_t typeLen = typeLengthAt(0);
    if (typeLen == 0)
        return false;
    return check(TokenKind::Identifier, typeLen);
}

StmtPtr Parser::parseVarDecl(bool requireSemicolon)
{
    const SourceLoc loc = peek().loc;
    TypeRef type;
    if (!parseType(type))
        return nullptr;
    if (type.name == "void" && !type.isArray)
    {
        errorAt(loc, "Variables cannot have type void");
        return nullptr;
    }

    Token nameTok;
    if (!expect(TokenKind::Identifier, "variable name", &nameTok))
        return nullptr;

    ExprPtr init;
    if (match(TokenKind::Equal))
    {
        init = parseExpression();
        if (!init)
            return nullptr;
    }

    if (requireSemicolon && !expect(TokenKind::Semicolon, "';' after variable declaration"))
        return nullptr;

    return std::make_unique<VarDeclStmt>(loc, std::move(type), nameTok.text, std::move(init));
}

StmtPtr Parser::parseExprStmt(bool requireSemicolon)
{
    const SourceLoc loc = peek().loc;
    ExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;
    if (requireSemicolon && !expect(TokenKind::Semicolon, "';' after expression"))
        return nullptr;
    return std::make_unique<ExprStmt>(loc, std::move(expr));
}

StmtPtr Parser::parseIfStmt()
{
    Token ifTok = advance();
    if (!expect(TokenKind::LParen, "'(' after 'if'"))
        return nullptr;
    ExprPtr cond = parseExpression();
    if (!cond)
        return nullptr;
    if (!expect(TokenKind::RParen, "')' after if condition"))
        return nullptr;

    StmtPtr thenBranch = parseStatement();
    if (!thenBranch)
        return nullptr;

    StmtPtr elseBranch;
    if (match(TokenKind::KwElse))
    {
        elseBranch = parseStatement();
        if (!elseBranch)
            return nullptr;
    }
    return std::make_unique<IfStmt>(
        ifTok.loc, std::move(cond), std::move(thenBranch), std::move(elseBranch));
}

StmtPtr Parser::parseWhileStmt()
{
    Token whileTok = advance();
    if (!expect(TokenKind::LParen, "'(' after 'while'"))
        return nullptr;
    ExprPtr cond = parseExpression();
    if (!cond)
        return nullptr;
    if (!expect(TokenKind::RParen, "')' after while condition"))
        return nullptr;

    StmtPtr body = parseStatement();
    if (!body)
        return nullptr;
    return std::make_unique<WhileStmt>(whileTok.loc, std::move(cond), std::move(body));
}

StmtPtr Parser::parseForStmt()
{
    Token forTok = advance();
    auto stmt = std::make_unique<ForStmt>(forTok.loc);

    if (!expect(TokenKind::LParen, "'(' after 'for'"))
        return nullptr;

    if (!check(TokenKind::Semicolon))
    {
        stmt->init = isVarDeclStart() ? parseVarDecl(false) : parseExprStmt(false);
        if (!stmt->init)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon, "';' after for initializer"))
        return nullptr;

    if (!check(TokenKind::Semicolon))
    {
        stmt->condition = parseExpression();
        if (!stmt->condition)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon, "';' after for condition"))
        return nullptr;

    if (!check(TokenKind::RParen))
    {
        do
        {
            ExprPtr update = parseExpression();
            if (!update)
                return nullptr;
            stmt->updates.push_back(std::move(update));
        } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen, "')' after for clauses"))
        return nullptr;

    stmt->body = parseStatement();
    if (!stmt->body)
        return nullptr;
    return stmt;
}

StmtPtr Parser::parseReturnStmt()
{
    Token retTok = advance();
    ExprPtr value;
    if (!check(TokenKind::Semicolon))
    {
        value = parseExpression();
        if (!value)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon, "';' after return"))
        return nullptr;
    return std::make_unique<ReturnStmt>(retTok.loc, std::move(value));
}

} // namespace pulse::frontend
