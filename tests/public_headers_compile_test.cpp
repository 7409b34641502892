#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "parq/booking/availability.hpp"
#include "parq/booking/booking.hpp"
#include "parq/booking/pricing.hpp"
#include "parq/booking/reference.hpp"
#include "parq/catalog/catalog.hpp"
#include "parq/cli/commands.hpp"
#include "parq/cli/options.hpp"
#include "parq/core/config.hpp"
#include "parq/core/errors.hpp"
#include "parq/core/log.hpp"
#include "parq/core/models.hpp"
#include "parq/core/text.hpp"
#include "parq/core/time.hpp"
#include "parq/core/types.hpp"
#include "parq/db/db.hpp"
#include "parq/db/queries.hpp"
#include "parq/db/schema.hpp"
#include "parq/engine/engine.hpp"
#include "parq/payment/payment.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
