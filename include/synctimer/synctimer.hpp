#ifndef SYNCTIMER_HPP
#define SYNCTIMER_HPP

#include "task.hpp"
#include "timer.hpp"

#endif // SYNCTIMER_HPP
