/**
 * @file BLEOperationQueue.h
 * @brief GATT operation queue for serializing characteristic operations
 *
 * BLE stacks typically do not queue operations internally - attempting to
 * perform multiple GATT operations on one peripheral simultaneously leads to
 * failures or undefined behavior. This queue ensures operations are processed
 * one at a time in order, and fails an operation that gets no answer within
 * its timeout.
 *
 * Subclasses implement executeOperation() to perform the actual platform
 * calls.
 */
#pragma once

#include "BLEDispatcher.h"
#include "BLETypes.h"
#include "Bytes.h"

#include <functional>
#include <queue>

namespace Tether { namespace BLE {

/**
 * @brief Base class for GATT operation queuing
 *
 * Call process() after enqueue() and periodically to start operations and
 * detect timeouts, and complete() from platform callbacks to signal
 * completion.
 */
class BLEOperationQueue {
public:
    explicit BLEOperationQueue(BLEDispatcher::Clock clock);
    virtual ~BLEOperationQueue() = default;

    /**
     * @brief Add operation to queue
     */
    void enqueue(GATTOperation op);

    /**
     * @brief Start the next operation if none is in progress, or time out
     * the current one
     *
     * @return true if an operation was started
     */
    bool process();

    /**
     * @brief Mark current operation complete
     *
     * @param error Error::ok() on success
     * @param response_data Response data (for reads)
     */
    void complete(const Error& error, const Bytes& response_data = Bytes());

    /**
     * @brief Check if operation is in progress
     */
    bool isBusy() const { return _has_current_op; }

    /**
     * @brief Get current operation (if any)
     * @return Pointer to current operation, or nullptr if none
     */
    const GATTOperation* currentOperation() const {
        return _has_current_op ? &_current_op : nullptr;
    }

    /**
     * @brief Fail every pending and current operation with the given error
     */
    void clear(const Error& error);

    /**
     * @brief Get queue depth (excluding the current operation)
     */
    size_t depth() const { return _queue.size(); }

protected:
    /**
     * @brief Execute a single operation - implement in subclass
     *
     * Return true if the operation was started successfully. Call complete()
     * when the platform answers.
     */
    virtual bool executeOperation(const GATTOperation& op) = 0;

private:
    void checkTimeout();

    BLEDispatcher::Clock _clock;
    std::queue<GATTOperation> _queue;
    GATTOperation _current_op;
    bool _has_current_op = false;
};

/**
 * @brief Helper class for building GATT operations
 */
class GATTOperationBuilder {
public:
    GATTOperationBuilder& read(const std::string& service_uuid, const std::string& characteristic_uuid);
    GATTOperationBuilder& write(const std::string& service_uuid, const std::string& characteristic_uuid,
                                const Bytes& data);
    GATTOperationBuilder& writeNoResponse(const std::string& service_uuid,
                                          const std::string& characteristic_uuid, const Bytes& data);
    GATTOperationBuilder& enableNotify(const std::string& service_uuid, const std::string& characteristic_uuid);
    GATTOperationBuilder& disableNotify(const std::string& service_uuid, const std::string& characteristic_uuid);
    GATTOperationBuilder& withTimeout(double timeout);
    GATTOperationBuilder& withCallback(std::function<void(const Error&, const Bytes&)> callback);

    GATTOperation build();

private:
    GATTOperation _op;
};

}} // namespace Tether::BLE
