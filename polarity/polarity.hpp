/*******************************************************************************
 * polarity/polarity.hpp
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_POLARITY_HEADER
#define POLARITY_POLARITY_HEADER

#include <polarity/api/config.hpp>
#include <polarity/api/pipeline.hpp>
#include <polarity/core/aggregator.hpp>
#include <polarity/core/classifier.hpp>
#include <polarity/core/group_table.hpp>
#include <polarity/core/metric.hpp>
#include <polarity/core/word_set.hpp>

#endif // !POLARITY_POLARITY_HEADER

/******************************************************************************/
