#pragma once

#include "locator.h"
#include "range.h"
#include "revspec.h"

#include <string_view>

namespace Stg {

/**
 * @name Parsing
 *
 * Parsers are purely syntactic: they never consult a stack. Strings which may
 * be either a patch name or a number / commit id prefix are always parsed as
 * names; the ambiguity is settled during resolution.
 *
 * Syntax errors are reported with MalformedSyntax and InvalidPatchName errors.
 * @{
 */

/**
 * Parses `anchor offsets` where anchor is a patch name, `@`, `{base}`, `^[<n>]`
 * or nothing (offset-only locator relative to the topmost patch).
 */
PatchLocator ParseLocator(const std::string_view text);

/** Parses `[<locator>]..[<locator>]`. */
PatchRangeBounds ParseRangeBounds(const std::string_view text);

/** Parses either a single locator or range bounds. */
PatchRange ParseRange(const std::string_view text);

/** Parses a locator followed by an optional git revision suffix (`^...` or `@{...}`). */
PatchLikeSpec ParsePatchLikeSpec(const std::string_view text);

/** Parses `[<branch>:]<patch-like>` or a git revision. */
SingleRevisionSpec ParseSingleRevisionSpec(const std::string_view text);

/** Parses `[<branch>:]<range>` or a single revision specification. */
RangeRevisionSpec ParseRevisionSpec(const std::string_view text);

/**@}*/

} // namespace Stg
