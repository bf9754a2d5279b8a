#pragma once
#include "../helpers/memory/Memory.hpp"

class CTabPage;
class CTabBar;
class CTransitionContext;

/* Shared pointer to a page */
using PHLPAGE = SP<CTabPage>;
/* Weak pointer to a page */
using PHLPAGEREF = WP<CTabPage>;

/* Shared pointer to the tab bar */
using PHLBAR = SP<CTabBar>;
/* Weak pointer to the tab bar */
using PHLBARREF = WP<CTabBar>;
