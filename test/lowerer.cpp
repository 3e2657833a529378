/**
 * test/lowerer.cpp
 * -----------------------------------------------------------------------------
 * Checks lowering of interpolated string literals. Prints every failed check,
 * returns 1 if any failed.
 */

#include "interp/global.hpp"
#include "interp/lowerer.hpp"

static int failures = 0;

static void check(bool condition, const std::string &what) {
  if (!condition) {
    std::cerr << "FAIL: " << what << std::endl;
    ++failures;
  }
}

static PartSequence expectParts(const std::string &raw, const LowerOptions &options) {
  LowerResult result = lower(raw, options);
  if (!result) {
    std::cerr << "FAIL: lower(" << quoteString(raw) << ") failed with "
      << result.getError().getName() << ": " << result.getError().getMessage()
      << std::endl;
    ++failures;
  }

  return result.getParts();
}

static void checkParts(const std::string &raw, const LowerOptions &options,
                       const PartSequence &expected) {
  PartSequence parts = expectParts(raw, options);
  check(parts == expected, "lower(" + quoteString(raw) + ") == "
      + toString(expected) + ", got " + toString(parts));
}

static void checkError(const std::string &raw, const LowerOptions &options,
                       size_t offset) {
  LowerResult result = lower(raw, options);
  check(!result, "lower(" + quoteString(raw) + ") fails");
  if (result)
    return;

  check(result.getError().getType() == lex_unbalanced_delimiter,
      "lower(" + quoteString(raw) + ") fails with UnbalancedDelimiter");
  check(result.getError().getOffset() == offset,
      "lower(" + quoteString(raw) + ") fails at " + std::to_string(offset)
      + ", got " + std::to_string(result.getError().getOffset()));
}

/*!\brief Concatenates literal text, with placeholder for embedded parts.
 */
static std::string concat(const PartSequence &parts, const std::string &placeholder) {
  std::string result;
  for (const Part &part : parts)
    result += part.isLiteral() ? part.getText() : placeholder;

  return result;
}

static void testScenarios() {
  LowerOptions brace(conv_brace);
  LowerOptions dollar(conv_dollar);

  checkParts("I ate {apples} and {bananas} totalling {apples + bananas} fruit.", brace, {
      Part::literal("I ate "), Part::embedded("apples"),
      Part::literal(" and "), Part::embedded("bananas"),
      Part::literal(" totalling "), Part::embedded("apples + bananas"),
      Part::literal(" fruit.")});

  checkParts("$name, hi!", dollar, {
      Part::literal(""), Part::embedded("name"), Part::literal(", hi!")});

  checkParts("Hello, world$exclamation", dollar, {
      Part::literal("Hello, world"), Part::embedded("exclamation"),
      Part::literal("")});

  checkParts("Hello, $name$exclamation How are you?", dollar, {
      Part::literal("Hello, "), Part::embedded("name"), Part::literal(""),
      Part::embedded("exclamation"), Part::literal(" How are you?")});

  checkParts("{{braces}} and }}{{", brace, {
      Part::literal("{braces} and }{")});

  // Unmatched '(' of $( at offset 8
  checkError("value: $(foo(bar)", dollar, 8);
  checkError("$(a", dollar, 1);
}

static void testEscapes() {
  LowerOptions brace(conv_brace);
  LowerOptions dollar(conv_dollar);

  checkParts("costs $$5", dollar, {Part::literal("costs $5")});
  checkParts("$$$x", dollar, {
      Part::literal("$"), Part::embedded("x"), Part::literal("")});
  checkParts("{{}}", brace, {Part::literal("{}")});
  checkParts("{{x}}", brace, {Part::literal("{x}")});

  // Not escapes in the other convention
  checkParts("{x} $y", dollar, {
      Part::literal("{x} "), Part::embedded("y"), Part::literal("")});
  checkParts("$y ()", brace, {Part::literal("$y ()")});
}

static void testGroupings() {
  LowerOptions brace(conv_brace);
  LowerOptions dollar(conv_dollar);

  checkParts("sum: $(f(a, g(b)) + 1)!", dollar, {
      Part::literal("sum: "), Part::embedded("f(a, g(b)) + 1"),
      Part::literal("!")});
  checkParts("$(a[0]){x}", dollar, {
      Part::literal(""), Part::embedded("a[0]"), Part::literal("{x}")});
  checkParts("{f({a})}", brace, {
      Part::literal(""), Part::embedded("f({a})"), Part::literal("")});
  checkParts("{}", brace, {
      Part::literal(""), Part::embedded(""), Part::literal("")});
  checkParts("$(a)$(b)", dollar, {
      Part::literal(""), Part::embedded("a"), Part::literal(""),
      Part::embedded("b"), Part::literal("")});

  // Identifier shorthand ends at the first non identifier character
  checkParts("$a_1.b", dollar, {
      Part::literal(""), Part::embedded("a_1"), Part::literal(".b")});

  PartSequence parts = expectParts("x $name $(y)", dollar);
  check(parts.size() == 5 && parts[1].isShorthand() && !parts[3].isShorthand(),
      "$name is shorthand, $(y) isn't");
  check(parts.size() == 5 && parts[1].getOffset() == 3 && parts[3].getOffset() == 10,
      "offsets of embedded parts point behind the introducer");
}

static void testUnbalanced() {
  LowerOptions brace(conv_brace);
  LowerOptions dollar(conv_dollar);

  checkError("{a", brace, 0);
  checkError("x {a(b}", brace, 6);
  checkError("$(a]", dollar, 3);
  checkError("a } b", brace, 2);
  checkError("{a}}", brace, 3);

  // ')' outside of an embedded expression is text
  checkParts("a ) b", dollar, {Part::literal("a ) b")});
}

static void testLoneIntroducer() {
  LowerOptions brace(conv_brace);
  LowerOptions dollar(conv_dollar);

  checkParts("5$", dollar, {Part::literal("5$")});
  checkParts("$ 5 $-", dollar, {Part::literal("$ 5 $-")});
  checkParts("{", brace, {Part::literal("{")});

  LowerOptions strictBrace(conv_brace);
  strictBrace.strictIntroducer = true;
  LowerOptions strictDollar(conv_dollar);
  strictDollar.strictIntroducer = true;

  checkError("5$", strictDollar, 1);
  checkError("a $ b", strictDollar, 2);
  checkError("{", strictBrace, 0);
  checkParts("$$ and $x", strictDollar, {
      Part::literal("$ and "), Part::embedded("x"), Part::literal("")});
}

static void testWithoutNormalization() {
  LowerOptions raw(conv_dollar);
  raw.normalize = false;

  checkParts("$a$b", raw, {Part::embedded("a"), Part::embedded("b")});
  checkParts("x$a", raw, {Part::literal("x"), Part::embedded("a")});
  checkParts("", raw, {Part::literal("")});

  PartSequence parts = expectParts("$a$b", raw);
  check(!isAlternating(parts), "$a$b doesn't alternate without normalization");
  check(isAlternating(normalize(parts)), "normalize() makes $a$b alternate");
}

static void testNormalize() {
  PartSequence merged = normalize({
      Part::literal("a"), Part::literal("b"), Part::embedded("x")});
  check(merged == PartSequence({
        Part::literal("ab"), Part::embedded("x"), Part::literal("")}),
      "normalize() merges adjacent fragments, got " + toString(merged));

  check(normalize({}) == PartSequence({Part::literal("")}),
      "normalize() of nothing is one empty fragment");

  PartSequence once = normalize({Part::embedded("x"), Part::embedded("y")});
  check(normalize(once) == once, "normalize() is idempotent");
}

static void testProperties() {
  const std::vector<std::string> inputs = {
    "",
    "plain text",
    "I ate $apples and $(bananas) totalling $(apples + bananas) fruit.",
    "$a$b$c",
    "$$ and $$$$",
    "$(f(x), (y)) $",
    "{a} {{ }} {b}{c}",
    "{{{x}}}",
    "text { with $ (introducers) } at odd places",
  };

  for (Convention convention : {conv_brace, conv_dollar}) {
    LowerOptions options(convention);
    for (const std::string &input : inputs) {
      LowerResult first = lower(input, options);
      LowerResult second = lower(input, options);

      check(first.isOk() == second.isOk() && first.getParts() == second.getParts(),
          "lower(" + quoteString(input) + ") is deterministic");

      if (!first)
        continue;

      check(isAlternating(first.getParts()),
          "lower(" + quoteString(input) + ") alternates, got "
          + toString(first.getParts()));

      // Text without introducers is returned unchanged
      if (input.find(options.introducer()) == std::string::npos
          && (convention != conv_brace || input.find('}') == std::string::npos)) {
        check(first.getParts() == PartSequence({Part::literal(input)}),
            "lower(" + quoteString(input) + ") is one fragment");
      }
    }
  }

  // Concatenation with placeholders reconstructs the unescaped literal
  LowerOptions dollar(conv_dollar);
  check(concat(expectParts("a $b $(c + d) $$e", dollar), "#") == "a # # $e",
      "concatenation reconstructs dollar literal");

  LowerOptions brace(conv_brace);
  check(concat(expectParts("{{a}} {b} {c + d}{e}", brace), "#") == "{a} # ##",
      "concatenation reconstructs brace literal");
}

static void testLiteralPosition() {
  InterpolatedLiteral literal("abc $x", TokenPos(10, 17, 3, 3));
  check(literal.getPosition(0).getStart() == 12, "raw text starts behind i\"");
  check(literal.getPosition(5).getLineStart() == 3, "positions stay on the line");

  LowerResult result = lower(literal, LowerOptions(conv_dollar));
  check(result && result.getParts().size() == 3, "lower() of InterpolatedLiteral");
}

int main() {
  testScenarios();
  testEscapes();
  testGroupings();
  testUnbalanced();
  testLoneIntroducer();
  testWithoutNormalization();
  testNormalize();
  testProperties();
  testLiteralPosition();

  if (failures > 0) {
    std::cerr << failures << " check(s) failed." << std::endl;
    return 1;
  }

  std::cout << "All checks passed." << std::endl;
  return 0;
}
