/**
 * @file BLEOperationQueue.cpp
 * @brief GATT operation queue implementation
 */

#include "BLEOperationQueue.h"
#include "Log.h"

namespace Tether { namespace BLE {

BLEOperationQueue::BLEOperationQueue(BLEDispatcher::Clock clock) : _clock(clock) {
}

void BLEOperationQueue::enqueue(GATTOperation op) {
    if (op.timeout <= 0) {
        op.timeout = Timing::OPERATION_TIMEOUT;
    }

    _queue.push(std::move(op));

    TRACE("BLEOperationQueue: Enqueued operation, queue depth: " +
          std::to_string(_queue.size()));
}

bool BLEOperationQueue::process() {
    // Check for timeout on current operation
    if (_has_current_op) {
        checkTimeout();
        return false;  // Still busy (or just timed out; next turn starts the next one)
    }

    if (_queue.empty()) {
        return false;
    }

    _current_op = std::move(_queue.front());
    _has_current_op = true;
    _queue.pop();

    GATTOperation& op = _current_op;
    op.started_at = _clock();

    TRACE("BLEOperationQueue: Starting operation type " +
          std::to_string(static_cast<int>(op.type)) + " on " + op.characteristic_uuid);

    bool started = executeOperation(op);

    if (!started) {
        WARNING("BLEOperationQueue: Platform refused operation on " + op.characteristic_uuid);
        GATTOperation failed = std::move(_current_op);
        _has_current_op = false;
        if (failed.callback) {
            failed.callback(Error(ErrorCode::TRANSPORT, STATUS_REJECTED), Bytes());
        }
        return false;
    }

    // Writes without response are never answered by the platform
    if (op.type == OperationType::WRITE_NO_RESPONSE) {
        complete(Error());
    }

    return true;
}

void BLEOperationQueue::complete(const Error& error, const Bytes& response_data) {
    if (!_has_current_op) {
        WARNING("BLEOperationQueue: complete() called with no current operation");
        return;
    }

    // Clear before invoking: the callback may enqueue and process the next operation
    GATTOperation op = std::move(_current_op);
    _has_current_op = false;

    double duration = _clock() - op.started_at;
    TRACE("BLEOperationQueue: Operation completed in " +
          std::to_string(static_cast<int>(duration * 1000)) + "ms, result: " +
          error.toString());

    if (op.callback) {
        op.callback(error, response_data);
    }
}

void BLEOperationQueue::clear(const Error& error) {
    std::queue<GATTOperation> pending;
    pending.swap(_queue);

    bool had_current = _has_current_op;
    GATTOperation current;
    if (had_current) {
        current = std::move(_current_op);
        _has_current_op = false;
    }

    if (had_current && current.callback) {
        current.callback(error, Bytes());
    }

    while (!pending.empty()) {
        GATTOperation op = std::move(pending.front());
        pending.pop();
        if (op.callback) {
            op.callback(error, Bytes());
        }
    }

    TRACE("BLEOperationQueue: Cleared all operations");
}

void BLEOperationQueue::checkTimeout() {
    if (!_has_current_op) {
        return;
    }

    GATTOperation& op = _current_op;
    double elapsed = _clock() - op.started_at;

    if (elapsed >= op.timeout) {
        WARNING("BLEOperationQueue: Operation on " + op.characteristic_uuid + " timed out after " +
                std::to_string(static_cast<int>(elapsed * 1000)) + "ms");

        complete(Error(ErrorCode::OPERATION_TIMEOUT), Bytes());
    }
}

//=============================================================================
// GATTOperationBuilder
//=============================================================================

GATTOperationBuilder& GATTOperationBuilder::read(const std::string& service_uuid,
                                                 const std::string& characteristic_uuid) {
    _op.type = OperationType::READ;
    _op.service_uuid = service_uuid;
    _op.characteristic_uuid = characteristic_uuid;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::write(const std::string& service_uuid,
                                                  const std::string& characteristic_uuid,
                                                  const Bytes& data) {
    _op.type = OperationType::WRITE;
    _op.service_uuid = service_uuid;
    _op.characteristic_uuid = characteristic_uuid;
    _op.data = data;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::writeNoResponse(const std::string& service_uuid,
                                                            const std::string& characteristic_uuid,
                                                            const Bytes& data) {
    _op.type = OperationType::WRITE_NO_RESPONSE;
    _op.service_uuid = service_uuid;
    _op.characteristic_uuid = characteristic_uuid;
    _op.data = data;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::enableNotify(const std::string& service_uuid,
                                                         const std::string& characteristic_uuid) {
    _op.type = OperationType::NOTIFY_ENABLE;
    _op.service_uuid = service_uuid;
    _op.characteristic_uuid = characteristic_uuid;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::disableNotify(const std::string& service_uuid,
                                                          const std::string& characteristic_uuid) {
    _op.type = OperationType::NOTIFY_DISABLE;
    _op.service_uuid = service_uuid;
    _op.characteristic_uuid = characteristic_uuid;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::withTimeout(double timeout) {
    _op.timeout = timeout;
    return *this;
}

GATTOperationBuilder& GATTOperationBuilder::withCallback(
    std::function<void(const Error&, const Bytes&)> callback) {
    _op.callback = callback;
    return *this;
}

GATTOperation GATTOperationBuilder::build() {
    return std::move(_op);
}

}} // namespace Tether::BLE
