#include <neurolens/core/error.hpp>
#include <gtest/gtest.h>

namespace nc = neurolens::core;

TEST(PipelineError, Names) {
  EXPECT_EQ(nc::to_string(nc::PipelineError::DecodeError), "DecodeError");
  EXPECT_EQ(nc::to_string(nc::PipelineError::PreprocessError), "PreprocessError");
  EXPECT_EQ(nc::to_string(nc::PipelineError::InferenceFault), "InferenceFault");
  EXPECT_EQ(nc::to_string(nc::PipelineError::AnnotationFailure), "AnnotationFailure");
  EXPECT_EQ(nc::to_string(nc::PipelineError::InvalidConfig), "InvalidConfig");
}

TEST(PipelineError, ClientFaults) {
  EXPECT_TRUE(nc::is_client_fault(nc::PipelineError::DecodeError));
  EXPECT_TRUE(nc::is_client_fault(nc::PipelineError::PreprocessError));
  EXPECT_FALSE(nc::is_client_fault(nc::PipelineError::InferenceFault));
  EXPECT_FALSE(nc::is_client_fault(nc::PipelineError::AnnotationFailure));
  EXPECT_FALSE(nc::is_client_fault(nc::PipelineError::InvalidConfig));
}
