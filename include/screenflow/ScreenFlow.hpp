#pragma once

#include "core/Error.hpp"
#include "dispatch/ArgumentTransformer.hpp"
#include "dispatch/CapabilityResolver.hpp"
#include "dispatch/CommandDispatcher.hpp"
#include "dispatch/EventDispatcher.hpp"
#include "dispatch/HandlerTable.hpp"
#include "dispatch/Inspector.hpp"
#include "dispatch/MotionEventDispatcher.hpp"
#include "dispatch/TypeSignature.hpp"
#include "events/MenuItem.hpp"
#include "events/MotionEvent.hpp"
#include "log/TaggedLogger.hpp"
#include "loop/EventLoop.hpp"
#include "modal/ModalTask.hpp"
#include "navigation/ActivityResult.hpp"
#include "navigation/CorrelationToken.hpp"
#include "navigation/Correlator.hpp"

#include <screenflow/app/DialogHost.hpp>
#include <screenflow/app/IdRegistry.hpp>
#include <screenflow/app/LifecycleInjection.hpp>
#include <screenflow/app/Navigator.hpp>
#include <screenflow/app/RuntimeOptions.hpp>
#include <screenflow/app/ScreenController.hpp>
