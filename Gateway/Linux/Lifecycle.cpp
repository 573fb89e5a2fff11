#include "Lifecycle.hpp"
#include "Core/Logger.hpp"

#include <boost/asio/post.hpp>

#include <csignal>
#include <cstring>

Lifecycle::Lifecycle(std::chrono::milliseconds stop_timeout)
    : io_()
    , signals_(io_, SIGINT, SIGTERM, SIGCHLD)
    , stop_timer_(io_)
    , stop_timeout_(stop_timeout)
{
    LOGD("lifecycle") << "signal handlers installed (SIGINT, SIGTERM, SIGCHLD)";
}

Lifecycle::~Lifecycle()
{
    boost::system::error_code ec;
    signals_.cancel(ec);
    signals_.clear(ec);
}

const char *Lifecycle::OutcomeName(Outcome o)
{
    switch (o)
    {
        case Outcome::Clean:          return "clean";
        case Outcome::AdapterCrashed: return "adapter-crashed";
    }
    return "?";
}

Lifecycle::Outcome Lifecycle::Run(AdapterSupervisor &supervisor)
{
    supervisor_ = &supervisor;
    done_       = false;
    outcome_    = Outcome::Clean;

    io_.restart();
    WaitSignal_();
    // SIGCHLD мог прийти раньше, чем процесс оказался под надзором.
    boost::asio::post(io_, [this]() { CheckChild_(); });

    LOGI("lifecycle") << "running, waiting for signal or adapter exit";
    io_.run();

    supervisor_ = nullptr;
    LOGI("lifecycle") << "finished: " << OutcomeName(outcome_);
    return outcome_;
}

void Lifecycle::WaitSignal_()
{
    signals_.async_wait([this](const boost::system::error_code &ec, int signo)
    {
        if (ec || done_)
        {
            return;
        }
        OnSignal_(signo);
        if (!done_)
        {
            WaitSignal_();
        }
    });
}

void Lifecycle::OnSignal_(int signo)
{
    if (signo == SIGCHLD)
    {
        CheckChild_();
        return;
    }

    if (term_signal_ != 0)
    {
        LOGW("lifecycle") << "signal " << signo << " (" << ::strsignal(signo)
                          << ") ignored, shutdown already in progress";
        return;
    }

    term_signal_ = signo;
    LOGI("lifecycle") << "received " << ::strsignal(signo) << ", stopping adapter";
    supervisor_->RequestStop();

    stop_timer_.expires_after(stop_timeout_);
    stop_timer_.async_wait([this](const boost::system::error_code &ec)
    {
        if (!ec && !done_)
        {
            OnStopTimeout_();
        }
    });

    // Адаптер мог завершиться ещё до сигнала.
    CheckChild_();
}

void Lifecycle::OnStopTimeout_()
{
    LOGW("lifecycle") << "adapter did not exit within " << stop_timeout_.count()
                      << " ms, sending SIGKILL";
    supervisor_->Kill();
    Finish_(Outcome::Clean);
}

void Lifecycle::CheckChild_()
{
    if (done_ || !supervisor_->TryReap())
    {
        return;
    }

    if (term_signal_ != 0 || supervisor_->StopRequested())
    {
        Finish_(Outcome::Clean);
    }
    else
    {
        LOGE("lifecycle") << "adapter exited unexpectedly: " << supervisor_->DescribeExit();
        Finish_(Outcome::AdapterCrashed);
    }
}

void Lifecycle::Finish_(Outcome o)
{
    outcome_ = o;
    done_    = true;

    boost::system::error_code ec;
    stop_timer_.cancel();
    signals_.cancel(ec);
    io_.stop();
}
