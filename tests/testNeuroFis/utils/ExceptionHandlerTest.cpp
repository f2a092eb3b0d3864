/**
 * @file ExceptionHandlerTest.cpp
 * @author seckler
 * @date 17.04.18
 */

#include "ExceptionHandlerTest.h"

#include <stdexcept>

#include "neurofis/utils/ExceptionHandler.h"

using neurofis::utils::ExceptionBehavior;
using neurofis::utils::ExceptionHandler;

void ExceptionHandlerTest::TearDown() {
  // reset to default values
  ExceptionHandler::setBehavior(ExceptionBehavior::throwException);
}

TEST_F(ExceptionHandlerTest, TestThrowCustom) {
  EXPECT_THROW(ExceptionHandler::exception(std::runtime_error("runtimeerror")), std::runtime_error);
}

TEST_F(ExceptionHandlerTest, TestDefault) {
  EXPECT_EQ(ExceptionHandler::getBehavior(), ExceptionBehavior::throwException);
  EXPECT_THROW(ExceptionHandler::exception("testthrow"), ExceptionHandler::NeuroFisException);
  EXPECT_THROW(ExceptionHandler::exception(std::string("testthrow")), ExceptionHandler::NeuroFisException);
  EXPECT_THROW(ExceptionHandler::exception(std::exception()), std::exception);
}

TEST_F(ExceptionHandlerTest, TestAbort) {
  ExceptionHandler::setBehavior(ExceptionBehavior::printAbort);
  EXPECT_EQ(ExceptionHandler::getBehavior(), ExceptionBehavior::printAbort);

  // the message goes to the logger on std::cout, death tests only see std::cerr
  EXPECT_DEATH(ExceptionHandler::exception("testabort"), "");
  EXPECT_DEATH(ExceptionHandler::exception(std::runtime_error("runtimeabort")), "");
}

TEST_F(ExceptionHandlerTest, TestAbortWithoutLogger) {
  ExceptionHandler::setBehavior(ExceptionBehavior::printAbort);
  neurofis::Logger::unregister();

  EXPECT_DEATH(ExceptionHandler::exception("no logger {}", 1), "no logger 1");
}

TEST_F(ExceptionHandlerTest, TestFormattedMessage) {
  try {
    ExceptionHandler::exception("value {} of {} is {}", 3, "x", 1.5);
    FAIL() << "No exception was thrown.";
  } catch (const ExceptionHandler::NeuroFisException &e) {
    EXPECT_STREQ(e.what(), "value 3 of x is 1.5");
  }
}
