#pragma once

#include <adjuster/schema/claim_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(adjuster::schema,
                             claim_status_t,
                             adjuster::schema::claim_status_t::submitted,
                             adjuster::schema::claim_status_t::approved,
                             adjuster::schema::claim_status_t::rejected)
