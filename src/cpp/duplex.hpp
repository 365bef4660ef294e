#pragma once

#include "duplex/basic_types.hpp"
#include "duplex/pipe.hpp"
#include "duplex/timing.hpp"
#include "duplex/Channel.hpp"
#include "duplex/Communicator.hpp"

/** @mainpage duplex

    Deadlock free communication with a child process over its stdin,
    stdout and stderr pipes. See duplex::Communicator.
*/
