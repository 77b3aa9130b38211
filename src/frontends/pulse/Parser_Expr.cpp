//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for the Pulse parser.
///
/// @details One method per precedence level, lowest first. Every method
/// returns nullptr after reporting an error so callers can unwind quickly.
///
//===----------------------------------------------------------------------===//

#include "frontends/pulse/Parser.hpp"
#include <limits>

namespace pulse::frontend
{

namespace
{
bool isAssignable(const Expr &e)
{
    return e.kind == ExprKind::Ident || e.kind == ExprKind::Member || e.kind == ExprKind::Index;
}
} // namespace

ExprPtr Parser::parseExpression()
{
    return parseAssignment();
}

ExprPtr Parser::parseAssignment()
{
    if (!enterExprLevel())
        return nullptr;
    DepthGuard guard{exprDepth_};

    ExprPtr target = parseConditional();
    if (!target)
        return nullptr;

    Token eqTok;
    if (match(TokenKind::Equal, &eqTok))
    {
        if (!isAssignable(*target))
        {
            errorAt(eqTok.loc, "Invalid assignment target");
            return nullptr;
        }
        ExprPtr value = parseAssignment();
        if (!value)
            return nullptr;
        return std::make_unique<AssignExpr>(eqTok.loc, std::move(target), std::move(value));
    }
    return target;
}

ExprPtr Parser::parseConditional()
{
    ExprPtr cond = parseLogicalOr();
    if (!cond)
        return nullptr;

    Token qTok;
    if (!match(TokenKind::Question, &qTok))
        return cond;

    ExprPtr thenExpr = parseExpression();
    if (!thenExpr)
        return nullptr;
    if (!expect(TokenKind::Colon, "':' in conditional expression"))
        return nullptr;
    if (!enterExprLevel())
        return nullptr;
    DepthGuard elseGuard{exprDepth_};
    ExprPtr elseExpr = parseConditional();
    if (!elseExpr)
        return nullptr;
    return std::make_unique<ConditionalExpr>(
        qTok.loc, std::move(cond), std::move(thenExpr), std::move(elseExpr));
}

ExprPtr Parser::parseLogicalOr()
{
    ExprPtr expr = parseLogicalAnd();
    if (!expr)
        return nullptr;
    // Each operator adds a level to the left-leaning tree.
    DepthGuard chain{exprDepth_, 0};

    while (check(TokenKind::PipePipe))
    {
        Token opTok = advance();
        if (!enterExprLevel())
            return nullptr;
        ++chain.levels;
        ExprPtr right = parseLogicalAnd();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, BinaryOp::Or, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseLogicalAnd()
{
    ExprPtr expr = parseEquality();
    if (!expr)
        return nullptr;
    DepthGuard chain{exprDepth_, 0};

    while (check(TokenKind::AmpAmp))
    {
        Token opTok = advance();
        if (!enterExprLevel())
            return nullptr;
        ++chain.levels;
        ExprPtr right = parseEquality();
        if (!right)
            return nullptr;
        expr =
            std::make_unique<BinaryExpr>(opTok.loc, BinaryOp::And, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseEquality()
{
    ExprPtr expr = parseRelational();
    if (!expr)
        return nullptr;
    DepthGuard chain{exprDepth_, 0};

    while (check(TokenKind::EqualEqual) || check(TokenKind::NotEqual))
    {
        Token opTok = advance();
        if (!enterExprLevel())
            return nullptr;
        ++chain.levels;
        BinaryOp op = opTok.is(TokenKind::EqualEqual) ? BinaryOp::Eq : BinaryOp::Ne;
        ExprPtr right = parseRelational();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseRelational()
{
    ExprPtr expr = parseAdditive();
    if (!expr)
        return nullptr;
    DepthGuard chain{exprDepth_, 0};

    while (check(TokenKind::Less) || check(TokenKind::LessEqual) || check(TokenKind::Greater) ||
           check(TokenKind::GreaterEqual))
    {
        Token opTok = advance();
        if (!enterExprLevel())
            return nullptr;
        ++chain.levels;
        BinaryOp op;
        switch (opTok.kind)
        {
            case TokenKind::Less:
                op = BinaryOp::Lt;
                break;
            case TokenKind::LessEqual:
                op = BinaryOp::Le;
                break;
            case TokenKind::Greater:
                op = BinaryOp::Gt;
                break;
            default:
                op = BinaryOp::Ge;
                break;
        }
        ExprPtr right = parseAdditive();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseAdditive()
{
    ExprPtr expr = parseMultiplicative();
    if (!expr)
        return nullptr;
    DepthGuard chain{exprDepth_, 0};

    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        Token opTok = advance();
        if (!enterExprLevel())
            return nullptr;
        ++chain.levels;
        BinaryOp op = opTok.is(TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
        ExprPtr right = parseMultiplicative();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseMultiplicative()
{
    ExprPtr expr = parseUnary();
    if (!expr)
        return nullptr;
    DepthGuard chain{exprDepth_, 0};

    while (check(TokenKind::Star) || check(TokenKind::Slash) || check(TokenKind::Percent))
    {
        Token opTok = advance();
        if (!enterExprLevel())
            return nullptr;
        ++chain.levels;
        BinaryOp op;
        switch (opTok.kind)
        {
            case TokenKind::Star:
                op = BinaryOp::Mul;
                break;
            case TokenKind::Slash:
                op = BinaryOp::Div;
                break;
            default:
                op = BinaryOp::Mod;
                break;
        }
        ExprPtr right = parseUnary();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseUnary()
{
    if (check(TokenKind::Bang) || check(TokenKind::Minus) || check(TokenKind::PlusPlus) ||
        check(TokenKind::MinusMinus))
    {
        Token opTok = advance();
        if (!enterExprLevel())
            return nullptr;
        DepthGuard guard{exprDepth_};
        ExprPtr operand = parseUnary();
        if (!operand)
            return nullptr;

        UnaryOp op;
        switch (opTok.kind)
        {
            case TokenKind::Bang:
                op = UnaryOp::Not;
                break;
            case TokenKind::Minus:
                op = UnaryOp::Neg;
                break;
            case TokenKind::PlusPlus:
                op = UnaryOp::PreInc;
                break;
            default:
                op = UnaryOp::PreDec;
                break;
        }
        if ((op == UnaryOp::PreInc || op == UnaryOp::PreDec) && !isAssignable(*operand))
        {
            errorAt(opTok.loc, "Invalid operand for increment/decrement");
            return nullptr;
        }
        return std::make_unique<UnaryExpr>(opTok.loc, op, std::move(operand));
    }
    return parsePostfix();
}

ExprPtr Parser::parsePostfix()
{
    ExprPtr expr = parsePrimary();
    if (!expr)
        return nullptr;
    DepthGuard chain{exprDepth_, 0};

    while (true)
    {
        Token tok;
        if (match(TokenKind::LParen, &tok))
        {
            if (!enterExprLevel())
                return nullptr;
            ++chain.levels;
            std::vector<ExprPtr> args;
            if (!parseCallArgs(args))
                return nullptr;
            expr = std::make_unique<CallExpr>(tok.loc, std::move(expr), std::move(args));
        }
        else if (match(TokenKind::Dot, &tok))
        {
            if (!enterExprLevel())
                return nullptr;
            ++chain.levels;
            Token nameTok;
            if (!expect(TokenKind::Identifier, "member name after '.'", &nameTok))
                return nullptr;
            expr = std::make_unique<MemberExpr>(nameTok.loc, std::move(expr), nameTok.text);
        }
        else if (match(TokenKind::LBracket, &tok))
        {
            if (!enterExprLevel())
                return nullptr;
            ++chain.levels;
            ExprPtr index = parseExpression();
            if (!index)
                return nullptr;
            if (!expect(TokenKind::RBracket, "']'"))
                return nullptr;
            expr = std::make_unique<IndexExpr>(tok.loc, std::move(expr), std::move(index));
        }
        else if (check(TokenKind::PlusPlus) || check(TokenKind::MinusMinus))
        {
            tok = advance();
            if (!enterExprLevel())
                return nullptr;
            ++chain.levels;
            if (!isAssignable(*expr))
            {
                errorAt(tok.loc, "Invalid operand for increment/decrement");
                return nullptr;
            }
            UnaryOp op = tok.is(TokenKind::PlusPlus) ? UnaryOp::PostInc : UnaryOp::PostDec;
            expr = std::make_unique<UnaryExpr>(tok.loc, op, std::move(expr));
        }
        else
        {
            break;
        }
    }
    return expr;
}

bool Parser::parseCallArgs(std::vector<ExprPtr> &args)
{
    if (match(TokenKind::RParen))
        return true;
    do
    {
        ExprPtr arg = parseExpression();
        if (!arg)
            return false;
        args.push_back(std::move(arg));
    } while (match(TokenKind::Comma));
    return expect(TokenKind::RParen, "')' after arguments");
}

ExprPtr Parser::parsePrimary()
{
    const Token &tok = peek();
    const SourceLoc loc = tok.loc;

    switch (tok.kind)
    {
        case TokenKind::IntegerLiteral:
        {
            Token lit = advance();
            if (lit.intValue > std::numeric_limits<int32_t>::max())
            {
                errorAt(loc, "Integer number too large: " + lit.text);
                return nullptr;
            }
            return std::make_unique<IntLiteralExpr>(loc, lit.intValue);
        }
        case TokenKind::NumberLiteral:
        {
            Token lit = advance();
            return std::make_unique<NumberLiteralExpr>(loc, lit.doubleValue);
        }
        case TokenKind::StringLiteral:
        {
            Token lit = advance();
            return std::make_unique<StringLiteralExpr>(loc, lit.stringValue);
        }
        case TokenKind::KwTrue:
            advance();
            return std::make_unique<BoolLiteralExpr>(loc, true);
        case TokenKind::KwFalse:
            advance();
            return std::make_unique<BoolLiteralExpr>(loc, false);
        case TokenKind::KwNull:
            advance();
            return std::make_unique<NullLiteralExpr>(loc);
        case TokenKind::KwThis:
            advance();
            return std::make_unique<ThisExpr>(loc);
        case TokenKind::Identifier:
        {
            Token name = advance();
            return std::make_unique<IdentExpr>(loc, name.text);
        }
        case TokenKind::KwString:
        {
            // `String.valueOf(x)`: the type keyword doubles as a namespace.
            if (check(TokenKind::Dot, 1))
            {
                advance();
                return std::make_unique<IdentExpr>(loc, "String");
            }
            break;
        }
        case TokenKind::KwNew:
            return parseNew();
        case TokenKind::LParen:
        {
            advance();
            ExprPtr inner = parseExpression();
            if (!inner)
                return nullptr;
            if (!expect(TokenKind::RParen, "')'"))
                return nullptr;
            return inner;
        }
        default:
            break;
    }

    if (tok.is(TokenKind::Eof))
        error("Unexpected end of input");
    else
        error("Unexpected token '" + tok.text + "'");
    return nullptr;
}

ExprPtr Parser::parseNew()
{
    Token newTok = advance();

    TypeRef type;
    if (peek().isTypeKeyword() && !check(TokenKind::KwVoid))
    {
        type.name = advance().text;
    }
    else
    {
        Token nameTok;
        if (!expect(TokenKind::Identifier, "class name after 'new'", &nameTok))
            return nullptr;
        type.name = nameTok.text;
    }

    if (match(TokenKind::LBracket))
    {
        ExprPtr length = parseExpression();
        if (!length)
            return nullptr;
        if (!expect(TokenKind::RBracket, "']'"))
            return nullptr;
        return std::make_unique<NewArrayExpr>(newTok.loc, std::move(type), std::move(length));
    }

    if (type.name == "int" || type.name == "double" || type.name == "boolean")
    {
        error("Expected '[' after primitive type in 'new'");
        return nullptr;
    }

    if (!expect(TokenKind::LParen, "'(' after class name"))
        return nullptr;
    std::vector<ExprPtr> args;
    if (!parseCallArgs(args))
        return nullptr;
    return std::make_unique<NewExpr>(newTok.loc, type.name, std::move(args));
}

} // namespace pulse::frontend
