#include "kj/test.h"
#include "peaktrade/core/error.h"

#include <kj/exception.h>
#include <kj/string.h>

using namespace peaktrade::core;

namespace {

KJ_TEST("Error: Each exception reports its category") {
  KJ_EXPECT(ParseException("x"_kj).code() == ErrorCode::Parse);
  KJ_EXPECT(ValidationException("x"_kj).code() == ErrorCode::Validation);
  KJ_EXPECT(ResourceException("x"_kj).code() == ErrorCode::Resource);
  KJ_EXPECT(PeakTradeException("x"_kj).code() == ErrorCode::Unknown);

  KJ_EXPECT(to_string(ErrorCode::Validation) == "Validation Error"_kj);
  KJ_EXPECT(to_string(ErrorCode::Unknown) == "Error"_kj);

  const PeakTradeException& base = ResourceException("cannot open returns.csv"_kj);
  KJ_EXPECT(base.describe() == "Resource Error: cannot open returns.csv"_kj);
}

KJ_TEST("Error: Exceptions carry message and location") {
  try {
    throw ValidationException(kj::str("alpha must lie in (0.5, 1.0), got ", 1.5));
  } catch (const PeakTradeException& e) {
    KJ_EXPECT(e.message() == "alpha must lie in (0.5, 1.0), got 1.5");
    KJ_EXPECT(kj::StringPtr(e.what()) == e.message());
    KJ_EXPECT(e.file().contains("test_error.cpp"));
    KJ_EXPECT(e.line() > 0);
    KJ_EXPECT(e.type() == kj::Exception::Type::FAILED);
  }
}

KJ_TEST("Error: Subclasses are distinguishable") {
  bool parse_caught = false;
  try {
    throw ParseException("bad row"_kj);
  } catch (const ValidationException&) {
    KJ_FAIL_EXPECT("ParseException caught as ValidationException");
  } catch (const ParseException&) {
    parse_caught = true;
  }
  KJ_EXPECT(parse_caught);
}

KJ_TEST("Error: Converts to kj::Exception") {
  ResourceException e("cannot open"_kj);
  auto kj_exception = e.toKjException();
  KJ_EXPECT(kj_exception.getDescription() == "cannot open");

  KJ_IF_SOME(caught, kj::runCatchingExceptions([&]() { e.throwException(); })) {
    KJ_EXPECT(caught.getDescription().contains("cannot open"));
  }
  else {
    KJ_FAIL_EXPECT("throwException did not throw");
  }
}

KJ_TEST("Error: Copies are independent") {
  ValidationException original("first"_kj);
  ValidationException copy = original;
  KJ_EXPECT(copy.message() == "first");
  KJ_EXPECT(copy.line() == original.line());
}

} // namespace
