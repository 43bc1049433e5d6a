#pragma once

#include "Core/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/TypeID.hpp"
#include "Core/Delegate.hpp"
#include "Core/Signal.hpp"
#include "Core/Log.hpp"
#include "Core/Profile.hpp"

#include "Entity/Entity.hpp"
#include "Entity/EntityManager.hpp"

#include "Component/Component.hpp"
#include "Component/ComponentRegistry.hpp"

#include "Storage/ComponentIndex.hpp"
#include "Storage/EntityDirectory.hpp"
#include "Storage/RemovalQueue.hpp"

#include "Registry/QueryEngine.hpp"
#include "Registry/SubscriptionLedger.hpp"
#include "Registry/Registry.hpp"
