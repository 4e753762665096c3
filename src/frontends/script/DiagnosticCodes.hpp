//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/script/DiagnosticCodes.hpp
// Purpose: Centralized diagnostic codes for the script compiler
// Key invariants: All codes are unique and follow R#### format; the thousands
//                 digit encodes the error kind
// Ownership/Lifetime: Static constants with program lifetime
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace rosella::frontends::script::diag
{

/// Driver error codes (R0000-R0999)
constexpr std::string_view UnreadableFile = "R0001";

/// Lexer error codes (R1000-R1999)
constexpr std::string_view UnexpectedCharacter = "R1001";
constexpr std::string_view UnterminatedString = "R1002";
constexpr std::string_view IntegerTooLarge = "R1003";
constexpr std::string_view UnterminatedComment = "R1004";

/// Parser error codes (R2000-R2999)
constexpr std::string_view UnexpectedToken = "R2001";
constexpr std::string_view NestedFunction = "R2002";
constexpr std::string_view ExpectedStatement = "R2003";
constexpr std::string_view ExpectedExpression = "R2004";
constexpr std::string_view NestingTooDeep = "R2005";

/// Name resolution error codes (R3000-R3999)
constexpr std::string_view UndeclaredIdentifier = "R3001";
constexpr std::string_view DuplicateFunction = "R3002";
constexpr std::string_view ReservedIdentifier = "R3003";
constexpr std::string_view DuplicateParameter = "R3004";
constexpr std::string_view UndeclaredFunction = "R3005";
constexpr std::string_view UnknownTarget = "R3006";

/// Type error codes (R4000-R4999)
constexpr std::string_view StringInIntegerContext = "R4001";
constexpr std::string_view ArithmeticOnUntyped = "R4002";
constexpr std::string_view ComparisonOutsideCondition = "R4003";
constexpr std::string_view OrderedStringComparison = "R4004";
constexpr std::string_view CallUsedAsValue = "R4005";
constexpr std::string_view WrongNumberOfArguments = "R4006";
constexpr std::string_view FunctionUsedAsValue = "R4007";

/// Code generation error codes (R5000-R5999)
constexpr std::string_view UnsupportedConstruct = "R5001";

} // namespace rosella::frontends::script::diag
