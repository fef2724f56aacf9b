#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>

#include "efsm/errors.hpp"
#include "efsm/result.hpp"

namespace {

using Error = efsm::Error<std::string, std::string, std::string>;

}  // namespace

TEST_CASE("Error - Kinds") {
  const auto missing = Error::no_transition("Coin", "Closed");
  CHECK(missing.kind() == efsm::ErrorKind::NoTransition);
  CHECK(missing.is(efsm::ErrorKind::NoTransition));
  REQUIRE(missing.event() != nullptr);
  REQUIRE(missing.state() != nullptr);
  CHECK(*missing.event() == "Coin");
  CHECK(*missing.state() == "Closed");
  CHECK(missing.cause() == nullptr);

  const auto internal = Error::internal("Coin", "Checking", "jammed");
  CHECK(internal.kind() == efsm::ErrorKind::InternalError);
  REQUIRE(internal.get_if<Error::InternalError>() != nullptr);
  CHECK(internal.get_if<Error::InternalError>()->cause == "jammed");
  REQUIRE(internal.cause() != nullptr);
  CHECK(*internal.cause() == "jammed");
  CHECK(internal.get_if<Error::NoTransition>() == nullptr);

  const auto failure = Error::transition_failure();
  CHECK(failure.kind() == efsm::ErrorKind::TransitionFailure);
  CHECK(failure.event() == nullptr);
  CHECK(failure.state() == nullptr);
  CHECK(std::holds_alternative<Error::TransitionFailure>(failure.variant()));
}

TEST_CASE("Error - Equality") {
  CHECK(Error::no_transition("a", "s") == Error::no_transition("a", "s"));
  CHECK_FALSE(Error::no_transition("a", "s") ==
              Error::no_transition("b", "s"));
  CHECK_FALSE(Error::no_transition("a", "s") ==
              Error::internal("a", "s", "x"));
  CHECK(Error::internal("a", "s", "x") == Error::internal("a", "s", "x"));
  CHECK_FALSE(Error::internal("a", "s", "x") ==
              Error::internal("a", "s", "y"));
  CHECK(Error::transition_failure() == Error::transition_failure());
}

TEST_CASE("Error - Description") {
  CHECK(Error::no_transition("Coin", "Closed").to_string() ==
        "NoTransition(event=Coin, state=Closed)");
  CHECK(Error::internal("Coin", "Checking", "jammed").to_string() ==
        "InternalError(event=Coin, state=Checking, cause=jammed)");
  CHECK(Error::transition_failure().to_string() == "TransitionFailure");
  CHECK(efsm::to_string(efsm::ErrorKind::InternalError) == "InternalError");
}

TEST_CASE("Result - Value And Error") {
  using R = efsm::Result<std::size_t, Error>;

  R ok = std::size_t{3};
  CHECK(ok.has_value());
  CHECK(static_cast<bool>(ok));
  CHECK(ok.value() == 3);
  CHECK(*ok == 3);
  CHECK_THROWS_AS((void)ok.error(), std::bad_variant_access);

  R failed = efsm::Unexpected<Error>(Error::transition_failure());
  CHECK_FALSE(failed.has_value());
  CHECK(failed.error().kind() == efsm::ErrorKind::TransitionFailure);
  CHECK(failed.value_or(9) == 9);
  CHECK_THROWS_AS((void)failed.value(), std::bad_variant_access);
}

TEST_CASE("Reentrancy Error - Is A Logic Error") {
  CHECK_THROWS_AS(throw efsm::ReentrancyError("nested"), std::logic_error);
}
