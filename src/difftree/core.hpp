#ifndef DIFFTREE_CORE_HPP
#define DIFFTREE_CORE_HPP

#include <difftree/core/atomic_diff.hpp>
#include <difftree/core/config.hpp>
#include <difftree/core/delta.hpp>
#include <difftree/core/diffable.hpp>
#include <difftree/core/exception.hpp>
#include <difftree/core/immutable.hpp>
#include <difftree/core/logging.hpp>
#include <difftree/core/map_diff.hpp>
#include <difftree/core/patch.hpp>
#include <difftree/core/sequence_diff.hpp>
#include <difftree/core/structure_diff.hpp>
#include <difftree/core/type_definitions.hpp>
#include <difftree/core/union_diff.hpp>
#include <difftree/core/utilities.hpp>

#endif
