#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <memory>
#include <thread>
#include <atomic>
#include <iostream>

namespace clinic::adapters::secondary {

/**
 * @brief Публикация доменных событий аутентификации в RabbitMQ
 *
 * Exchange: topic (clinic.auth.events), routing keys: user.logged_in,
 * user.logged_out, user.mfa_enabled, ...
 *
 * AMQP-CPP не потокобезопасен, поэтому publish() только ставит
 * отправку в очередь io_context рабочего потока.
 */
class RabbitMQEventPublisher : public ports::output::IEventPublisher {
public:
    explicit RabbitMQEventPublisher(std::shared_ptr<RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQEventPublisher] Created for " << settings_->describe()
                  << " exchange=" << exchangeName_ << std::endl;
        start();
    }

    ~RabbitMQEventPublisher() override {
        stop();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQEventPublisher] Cannot publish " << routingKey << ": not running" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!channel_ || !exchangeReady_) {
                std::cerr << "[RabbitMQEventPublisher] Dropped " << routingKey << ": not connected" << std::endl;
                return;
            }
            try {
                channel_->publish(exchangeName_, routingKey, message);
                std::cout << "[RabbitMQEventPublisher] Published " << routingKey << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQEventPublisher] Publish error: " << e.what() << std::endl;
            }
        });
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        workGuard_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQEventPublisher] Stopped" << std::endl;
    }

private:
    void start() {
        if (running_) return;

        running_ = true;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQEventPublisher] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQEventPublisher] Started" << std::endl;
    }

    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(
            &handler_, AMQP::Address(settings_->getAmqpUrl()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                exchangeReady_ = true;
                std::cout << "[RabbitMQEventPublisher] Exchange declared: " << exchangeName_ << std::endl;
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQEventPublisher] Exchange error: " << msg << std::endl;
            });
    }

    std::shared_ptr<RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    std::atomic<bool> exchangeReady_{false};
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace clinic::adapters::secondary
