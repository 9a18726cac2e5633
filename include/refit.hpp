#pragma once

#include "refit/cli.hpp"
#include "refit/commands.hpp"
#include "refit/config.hpp"
#include "refit/format.hpp"
#include "refit/items.hpp"
#include "refit/pipeline.hpp"
#include "refit/script.hpp"
#include "refit/session.hpp"
#include "refit/snapshot.hpp"
#include "refit/utils.hpp"
