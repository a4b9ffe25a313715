//----------------------------------------------------------------------------------------------------------------------
#include "FerryHub/ExecutionToken.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------

TEST(ExecutionTokenSuite, StandbyTest)
{
    Hub::ExecutionToken token;
    EXPECT_EQ(token.Status(), ExecutionStatus::Standby);
    EXPECT_FALSE(token.IsExecutionActive());
    EXPECT_FALSE(token.IsExecutionRequested());

    // A stop can only be requested while the core is executing.
    EXPECT_FALSE(token.RequestStop());
    EXPECT_FALSE(token.RequestStop(ExecutionStatus::UnexpectedShutdown));
    EXPECT_EQ(token.Status(), ExecutionStatus::Standby);
    EXPECT_FALSE(token.IsExecutionRequested());
}

//----------------------------------------------------------------------------------------------------------------------
