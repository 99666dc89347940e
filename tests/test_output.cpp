#include "doctest.h"

#include "core/output.h"

TEST_CASE("message templates") {
	CHECK(message_text("pass `1` added `2` tokens", 1, 3, 12) == "pass 3 added 12 tokens");
	CHECK(message_text("no placeholders", 1, 5) == "no placeholders");
	CHECK(message_text("`2` before `1`", 1, "a", "b") == "b before a");
}

TEST_CASE("test output") {
	const auto output = std::make_shared<TestOutput>();
	const OutputRef ref = output;

	message(ref, "RuleSet", "load", "rules for `1` failed to load", "Numeral");
	message(ref, "PassDriver", "budget", "stopped");

	CHECK(output->contains("budget"));
	CHECK_FALSE(output->contains("pass"));
	CHECK(output->test_line("RuleSet::load: rules for Numeral failed to load"));
	CHECK(output->test_line("PassDriver::budget: stopped"));
	CHECK(output->test_empty());
	CHECK(output->empty());

	// a null output ignores messages.
	message(OutputRef(), "PassDriver", "budget", "stopped");
}
